//
// Created by Giuseppe Francione on 17/01/26.
//

/**
 * @file webpress.cpp
 * @brief Implementation of the public Converter API.
 */

#include "../../include/webpress.hpp"

#include "../../include/cancellation_token.hpp"
#include "../../include/cwebp_encoder.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/logger.hpp"
#include "../../include/run_coordinator.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace webpress {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    ConverterObserver* observer_;
public:
    explicit BridgeLogSink(ConverterObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

struct Converter::Impl {
    RunConfig config;
    ConverterObserver* observer = nullptr;

    mutable std::mutex mtx;
    std::shared_ptr<CancellationToken> token; ///< Token of the run in progress
    std::atomic<bool> running{false};

    std::jthread worker;
    RunSummary last_summary;

    void setupEventBridging(EventBus& bus) const {
        if (!observer) return;

        bus.subscribe<FolderStartEvent>([obs = observer](const FolderStartEvent& e) {
            obs->onFolderStart(e.folder, e.convertible, e.skipped);
        });

        bus.subscribe<ImageConvertCompleteEvent>([obs = observer](const ImageConvertCompleteEvent& e) {
            obs->onImageFinish(e.source, e.original_size, e.converted_size);
        });

        bus.subscribe<ImageConvertErrorEvent>([obs = observer](const ImageConvertErrorEvent& e) {
            obs->onImageError(e.source, e.error_message);
        });

        bus.subscribe<FolderCompleteEvent>([obs = observer](const FolderCompleteEvent& e) {
            obs->onFolderFinish(e.summary);
        });

        bus.subscribe<ProgressEvent>([obs = observer](const ProgressEvent& e) {
            obs->onProgress(e.percent);
        });

        bus.subscribe<StatusEvent>([obs = observer](const StatusEvent& e) {
            obs->onStatus(e.message);
        });

        bus.subscribe<RunSummaryEvent>([obs = observer](const RunSummaryEvent& e) {
            obs->onRunFinish(e.summary);
        });
    }

    std::shared_ptr<CancellationToken> begin_run() {
        if (running.exchange(true)) {
            throw std::runtime_error("A conversion run is already in progress");
        }
        std::lock_guard lock(mtx);
        token = std::make_shared<CancellationToken>();
        return token;
    }

    RunSummary execute(RunConfig cfg, const std::shared_ptr<CancellationToken>& run_token) {
        EventBus bus;
        setupEventBridging(bus);

        // inject bridge sink if observer is present
        const ILogSink* bridge = nullptr;
        if (observer) {
            auto sink = std::make_unique<BridgeLogSink>(observer);
            bridge = sink.get();
            Logger::add_sink(std::move(sink));
        }

        RunSummary summary;
        try {
            CwebpEncoder encoder(cfg.encoder_program);
            RunCoordinator coordinator(std::move(cfg), encoder, bus, *run_token);
            summary = coordinator.run();
        } catch (...) {
            if (bridge) Logger::remove_sink(bridge);
            running.store(false);
            throw;
        }

        if (bridge) Logger::remove_sink(bridge);
        running.store(false);
        return summary;
    }
};

Converter::Converter() : impl_(std::make_unique<Impl>()) {}

Converter::~Converter() {
    if (impl_) {
        stop();
        if (impl_->worker.joinable()) impl_->worker.join();
    }
}

Converter::Converter(Converter&&) noexcept = default;
Converter& Converter::operator=(Converter&&) noexcept = default;

Converter& Converter::quality(const int val) {
    impl_->config.quality = clamp_quality(val);
    return *this;
}

Converter& Converter::archiveFormat(const ArchiveFormat fmt) {
    impl_->config.archive_format = fmt;
    return *this;
}

Converter& Converter::replaceOriginals(const bool val) {
    impl_->config.replace_originals = val;
    return *this;
}

Converter& Converter::skipExisting(const bool val) {
    impl_->config.skip_existing_webp = val;
    return *this;
}

Converter& Converter::encoder(const std::string& program) {
    impl_->config.encoder_program = program.empty() ? "cwebp" : program;
    return *this;
}

void Converter::setObserver(ConverterObserver* observer) {
    impl_->observer = observer;
}

RunSummary Converter::run(const std::vector<std::filesystem::path>& folders) {
    auto run_token = impl_->begin_run();
    RunConfig cfg = impl_->config;
    cfg.folders = folders;
    return impl_->execute(std::move(cfg), run_token);
}

void Converter::start(const std::vector<std::filesystem::path>& folders) {
    auto run_token = impl_->begin_run();
    if (impl_->worker.joinable()) impl_->worker.join();

    RunConfig cfg = impl_->config;
    cfg.folders = folders;

    Impl* impl = impl_.get();
    impl_->worker = std::jthread([impl, cfg = std::move(cfg), run_token]() mutable {
        try {
            impl->last_summary = impl->execute(std::move(cfg), run_token);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Conversion run failed: ") + e.what(), "webpress");
        }
    });
}

RunSummary Converter::wait() {
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
    return impl_->last_summary;
}

void Converter::stop() {
    std::lock_guard lock(impl_->mtx);
    if (impl_->token) {
        impl_->token->request();
    }
}

bool Converter::isRunning() const {
    return impl_->running.load();
}

} // namespace webpress
