#pragma once

#include "../Target.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace nearme::domain {

/// Malformed or missing target source. The whole load is rejected.
class LoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TargetStore {
public:
    explicit TargetStore(std::string sourcePath);

    /// Replaces the loaded set on success; leaves it untouched on LoadError.
    const std::vector<Target>& load();

    const std::vector<Target>& targets() const { return targets_; }
    const std::string& sourcePath() const { return sourcePath_; }

    static std::vector<Target> parse(const std::string& json);
    static void validate(const std::vector<Target>& targets);

private:
    std::string sourcePath_;
    std::vector<Target> targets_;
};

} // namespace nearme::domain
