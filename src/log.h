#pragma once
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string_view>

namespace stopevents {

using TextLogger = std::function<void(std::string_view)>;

inline TextLogger OstreamLogger(std::ostream& os) {
    return [&os](std::string_view msg) { os << msg << "\n"; };
}

inline TextLogger NullLogger() {
    return [](std::string_view) {};
}

// Serializes calls into `inner` so that partition workers can share one sink.
inline TextLogger SynchronizedLogger(TextLogger inner) {
    auto mutex = std::make_shared<std::mutex>();
    return [mutex, inner = std::move(inner)](std::string_view msg) {
        std::lock_guard<std::mutex> lock(*mutex);
        inner(msg);
    };
}

}  // namespace stopevents
