#pragma once

#include <presentation_sink.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <string>
#include <utility>

namespace platform {

/**
 * @brief Presentation sink writing each view as one JSON object per line
 * 
 * Generic template-based implementation that works with any view type.
 * Requires the type to have a to_json() function defined for serialization.
 * Output starts with '{' so it can be told apart from log lines.
 * 
 * @tparam ViewT Type of view (must have to_json function)
 */
template<typename ViewT>
class JsonLinesSink : public features::PresentationSink<ViewT> {
public:
    /**
     * @param out Destination stream (not owned)
     */
    explicit JsonLinesSink(FILE* out = stdout)
        : out_(out) {}

    // Prevent copying
    JsonLinesSink(const JsonLinesSink&) = delete;
    JsonLinesSink& operator=(const JsonLinesSink&) = delete;

    void publish(const ViewT& view) override {
        // Serialize to JSON using automatic conversion via to_json()
        nlohmann::json j = view;
        std::string line = j.dump();

        if (line == lastLine_) {
            return;  // Unchanged since the previous publish
        }
        std::fprintf(out_, "%s\n", line.c_str());
        std::fflush(out_);
        lastLine_ = std::move(line);
    }

private:
    FILE* out_;
    std::string lastLine_;
};

} // namespace platform
