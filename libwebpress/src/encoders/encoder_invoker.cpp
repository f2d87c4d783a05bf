//
// Created by Giuseppe Francione on 15/01/26.
//

#include "../../include/encoder.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <exception>
#include <string>

namespace webpress {

ConversionOutcome invoke_encoder(IEncoder& encoder, const EncodeRequest& request) noexcept {
    ConversionOutcome outcome;
    try {
        const std::string name = request.source.filename().string();
        const auto original_size = safe_file_size(request.source);

        try {
            outcome = encoder.encode(request);
        } catch (const std::exception& e) {
            outcome = ConversionOutcome{};
            outcome.error_message = name + ": " + e.what();
        } catch (...) {
            outcome = ConversionOutcome{};
            outcome.error_message = name + ": conversion failed";
        }
        outcome.original_size = original_size;

        if (!outcome.success) {
            outcome.converted_size = 0;
            if (!outcome.error_message || outcome.error_message->empty()) {
                outcome.error_message = name + ": conversion failed";
            }
            Logger::log(LogLevel::Error, *outcome.error_message, "Encoder");
            return outcome;
        }

        const auto produced = try_file_size(request.target);
        if (!produced) {
            Logger::log(LogLevel::Warning, "Encoder reported success but produced no file for " + name, "Encoder");
        }
        outcome.converted_size = produced.value_or(0);
        outcome.error_message.reset();
        return outcome;
    } catch (const std::exception& e) {
        // only allocation failures can get here
        ConversionOutcome failed;
        failed.error_message = request.source.filename().string() + ": " + e.what();
        return failed;
    } catch (...) {
        ConversionOutcome failed;
        failed.error_message = request.source.filename().string() + ": conversion failed";
        return failed;
    }
}

} // namespace webpress
