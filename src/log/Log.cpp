#include "hs602/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace hs602::log {

namespace {

enum class Channel { Info, Error };

LogHandler makeDefaultSink(Channel channel) {
    if (channel == Channel::Error) {
        return [](std::string_view message) {
            std::cerr << message;
            std::cerr.flush();
        };
    }
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

struct Sinks {
    std::mutex mutex;
    LogHandler info = makeDefaultSink(Channel::Info);
    LogHandler error = makeDefaultSink(Channel::Error);
};

Sinks& sinks() {
    static Sinks instance;
    return instance;
}

std::atomic<bool> debugEnabled{false};

void install(LogHandler& slot, LogHandler handler, Channel channel) {
    slot = handler ? std::move(handler) : makeDefaultSink(channel);
}

void emit(Channel channel, std::string_view message) {
    LogHandler handler;
    {
        auto& s = sinks();
        std::lock_guard lock(s.mutex);
        handler = channel == Channel::Error ? s.error : s.info;
    }
    // Invoke outside the lock so handlers may log themselves.
    if (handler) {
        handler(message);
    }
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    install(s.info, std::move(handler), Channel::Info);
}

void setErrorLogHandler(LogHandler handler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    install(s.error, std::move(handler), Channel::Error);
}

void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler) {
    auto& s = sinks();
    std::lock_guard lock(s.mutex);
    install(s.info, std::move(infoHandler), Channel::Info);
    install(s.error, std::move(errorHandler), Channel::Error);
}

void resetLogHandlers() {
    setLogHandlers(nullptr, nullptr);
}

void setDebugLogging(bool enabled) {
    debugEnabled.store(enabled, std::memory_order_relaxed);
}

bool debugLoggingEnabled() {
    return debugEnabled.load(std::memory_order_relaxed);
}

void logDebug(std::string_view message) {
    if (debugLoggingEnabled()) {
        emit(Channel::Info, message);
    }
}

void logInfo(std::string_view message) {
    emit(Channel::Info, message);
}

void logError(std::string_view message) {
    emit(Channel::Error, message);
}

} // namespace hs602::log
