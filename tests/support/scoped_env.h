#pragma once

#include <cstdlib>
#include <optional>
#include <string>

namespace clawdesk::test_support {

/**
 * RAII helper to set (or clear) an environment variable and restore it.
 */
class ScopedEnv {
public:
    ScopedEnv(const char* name, std::optional<std::string> value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            hadValue_ = true;
            oldValue_ = old;
        }
        if (value) {
            set(value->c_str());
        } else {
            unset();
        }
    }

    ~ScopedEnv() {
        if (hadValue_) {
            set(oldValue_.c_str());
        } else {
            unset();
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    void set(const char* value) {
#ifdef _WIN32
        _putenv_s(name_.c_str(), value);
#else
        setenv(name_.c_str(), value, 1);
#endif
    }

    void unset() {
#ifdef _WIN32
        _putenv_s(name_.c_str(), "");
#else
        unsetenv(name_.c_str());
#endif
    }

    std::string name_;
    std::string oldValue_;
    bool hadValue_{false};
};

} // namespace clawdesk::test_support
