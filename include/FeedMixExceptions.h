#ifndef FEEDMIX_EXCEPTIONS_H
#define FEEDMIX_EXCEPTIONS_H

#include <stdexcept>
#include <string>
#include <vector>

namespace FeedMix {

class FeedMixException : public std::runtime_error {
public:
    explicit FeedMixException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public FeedMixException {
public:
    explicit IOException(const std::string& message) : FeedMixException("IO Error: " + message) {}
};

class DatasetException : public FeedMixException {
public:
    explicit DatasetException(const std::string& message) : FeedMixException("Dataset Error: " + message) {}
};

class ConfigurationException : public FeedMixException {
public:
    explicit ConfigurationException(const std::string& message) : FeedMixException("Configuration Error: " + message) {}
};

/**
 * @brief Raised by normalization when required source headers are absent.
 * @details The only error that aborts an analysis run.
 */
class MissingColumnException : public DatasetException {
public:
    explicit MissingColumnException(std::vector<std::string> missing)
        : DatasetException("Missing required columns: " + join(missing)), missing_(std::move(missing)) {}

    const std::vector<std::string>& missingColumns() const noexcept { return missing_; }

private:
    static std::string join(const std::vector<std::string>& names) {
        std::string out;
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) out += ", ";
            out += names[i];
        }
        return out;
    }

    std::vector<std::string> missing_;
};

} // namespace FeedMix

#endif // FEEDMIX_EXCEPTIONS_H
