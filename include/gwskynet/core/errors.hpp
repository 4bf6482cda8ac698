#pragma once

#include <stdexcept>
#include <string>

namespace gwskynet {

class GwSkyNetError : public std::runtime_error {
public:
    explicit GwSkyNetError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public GwSkyNetError {
public:
    explicit ConfigError(const std::string& message)
        : GwSkyNetError("Config error: " + message) {}
};

class ValidationError : public GwSkyNetError {
public:
    explicit ValidationError(const std::string& message)
        : GwSkyNetError("Validation error: " + message) {}
};

class IOError : public GwSkyNetError {
public:
    explicit IOError(const std::string& message)
        : GwSkyNetError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class PipelineError : public GwSkyNetError {
public:
    explicit PipelineError(const std::string& message)
        : GwSkyNetError("Pipeline error: " + message) {}
};

// Raised once at startup when the classifier cannot be constructed.
class ModelUnavailableError : public GwSkyNetError {
public:
    explicit ModelUnavailableError(const std::string& message)
        : GwSkyNetError("Model unavailable: " + message) {}
};

// Per-event failure. The event id may be attached after the throw site
// (stages below the reader do not know which event they are processing).
class EventError : public GwSkyNetError {
public:
    EventError(const std::string& kind, const std::string& message,
               const std::string& event_id = "")
        : GwSkyNetError(kind + ": " + message),
          kind_(kind), detail_(message), event_id_(event_id) {
        rebuild();
    }

    const std::string& event_id() const { return event_id_; }
    const std::string& detail() const { return detail_; }

    void set_event_id(const std::string& event_id) {
        event_id_ = event_id;
        rebuild();
    }

    const char* what() const noexcept override { return what_.c_str(); }

private:
    void rebuild() {
        what_ = kind_ + ": " + detail_;
        if (!event_id_.empty()) {
            what_ += " [event " + event_id_ + "]";
        }
    }

    std::string kind_;
    std::string detail_;
    std::string event_id_;
    std::string what_;
};

class MalformedSkyMapError : public EventError {
public:
    explicit MalformedSkyMapError(const std::string& message,
                                  const std::string& event_id = "")
        : EventError("Malformed sky map", message, event_id) {}
};

class MissingDistanceDataError : public EventError {
public:
    explicit MissingDistanceDataError(const std::string& message,
                                      const std::string& event_id = "")
        : EventError("Missing distance data", message, event_id) {}
};

class UnsupportedGridShapeError : public EventError {
public:
    explicit UnsupportedGridShapeError(const std::string& message,
                                       const std::string& event_id = "")
        : EventError("Unsupported grid shape", message, event_id) {}
};

// Classifier failed or returned a value outside [0,1] for one event.
class ClassificationError : public EventError {
public:
    explicit ClassificationError(const std::string& message,
                                 const std::string& event_id = "")
        : EventError("Classification failed", message, event_id) {}
};

} // namespace gwskynet
