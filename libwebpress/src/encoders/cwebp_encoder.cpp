//
// Created by Giuseppe Francione on 15/01/26.
//

#include "../../include/cwebp_encoder.hpp"
#include "../../include/logger.hpp"
#include "../../include/process_runner.hpp"
#include <sstream>
#include <string>
#include <utility>

namespace webpress {

namespace {

// cwebp prints a banner and statistics; the last non-empty line carries the error
std::string last_line(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    std::string last;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") != std::string::npos) last = line;
    }
    return last;
}

} // namespace

CwebpEncoder::CwebpEncoder(std::string program) : program_(std::move(program)) {}

bool CwebpEncoder::is_available() {
    resolved_ = find_executable(program_);
    if (resolved_) {
        Logger::log(LogLevel::Debug, "Using encoder: " + resolved_->string(), "Encoder");
    } else {
        Logger::log(LogLevel::Error, "Encoder not found: " + program_, "Encoder");
    }
    return resolved_.has_value();
}

bool CwebpEncoder::wants_lossless(const EncodeRequest& request) noexcept {
    return request.source_format == kLosslessTriggerFormat && clamp_quality(request.quality) == kMaxQuality;
}

std::vector<std::string> CwebpEncoder::build_arguments(const EncodeRequest& request) {
    std::vector<std::string> args;
    if (wants_lossless(request)) {
        args.emplace_back("-lossless");
    } else {
        args.emplace_back("-q");
        args.emplace_back(std::to_string(clamp_quality(request.quality)));
    }
    args.push_back(request.source.string());
    args.emplace_back("-o");
    args.push_back(request.target.string());
    return args;
}

ConversionOutcome CwebpEncoder::encode(const EncodeRequest& request) {
    ConversionOutcome outcome;
    const std::string name = request.source.filename().string();

    if (!resolved_ && !is_available()) {
        outcome.error_message = name + ": encoder '" + program_ + "' not found";
        return outcome;
    }

    const auto args = build_arguments(request);
    std::string cmdline = resolved_->string();
    for (const auto& a : args) cmdline += " " + a;
    Logger::log(LogLevel::Debug, cmdline, "Encoder");

    const ProcessResult result = run_process(*resolved_, args);
    if (result.exit_code != 0) {
        std::string reason = "cwebp exited with code " + std::to_string(result.exit_code);
        const std::string detail = last_line(result.output);
        if (!detail.empty()) {
            reason += " (" + detail + ")";
        }
        outcome.error_message = name + ": " + reason;
        return outcome;
    }

    outcome.success = true;
    return outcome;
}

} // namespace webpress
