#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace twinboot::identity {

// -----------------------------------------------------------------------------
// ISiblingDetector - "am I a secondary instance, and what is my label?"
// -----------------------------------------------------------------------------

// One implementation per piece of clone tooling the development host may use
// to launch extra local clients. The SignalCollector asks a configured, ordered
// list of these and takes the first positive answer.
class ISiblingDetector {
public:
    virtual ~ISiblingDetector() = default;

    // Short stable name used in config files and logs.
    virtual std::string Name() const = 0;

    virtual bool IsSecondaryInstance() const = 0;

    // Only meaningful when IsSecondaryInstance() is true. May be empty.
    virtual std::string Label() const = 0;
};

// Never reports a secondary instance. Used when no clone tooling is configured.
class NoneActiveDetector final : public ISiblingDetector {
public:
    std::string Name() const override { return "none"; }
    bool IsSecondaryInstance() const override { return false; }
    std::string Label() const override { return {}; }
};

// Clones started by the host's virtual-player launcher. The launcher passes
//   --virtual-project-clone   marks the process as a clone
//   -name <label>             the player name chosen in the host UI
// Several -name pairs concatenate in argument order.
class VirtualCloneDetector final : public ISiblingDetector {
public:
    static constexpr std::string_view kCloneFlag = "--virtual-project-clone";
    static constexpr std::string_view kNameFlag  = "-name";

    explicit VirtualCloneDetector(std::vector<std::string> args);

    std::string Name() const override { return "virtual-clone"; }
    bool IsSecondaryInstance() const override;
    std::string Label() const override;

private:
    std::vector<std::string> m_args;
};

// Clones created by copying/linking the project folder. The clone tool drops
//   <projectDir>/.clone      marker (contents ignored)
//   <projectDir>/.clonearg   optional free-form argument used as the label
class CloneMarkerDetector final : public ISiblingDetector {
public:
    static constexpr std::string_view kMarkerFile   = ".clone";
    static constexpr std::string_view kArgumentFile = ".clonearg";

    explicit CloneMarkerDetector(std::filesystem::path projectDir);

    std::string Name() const override { return "clone-marker"; }
    bool IsSecondaryInstance() const override;
    std::string Label() const override;

    [[nodiscard]] const std::filesystem::path& ProjectDir() const noexcept { return m_projectDir; }

private:
    std::filesystem::path m_projectDir;
};

// Inputs the built-in detectors may need.
struct DetectorContext {
    std::vector<std::string> args;
    std::filesystem::path projectDir;
};

// Builds a detector from its config name ("none", "virtual-clone",
// "clone-marker"). Returns nullptr for unknown names.
[[nodiscard]] std::unique_ptr<ISiblingDetector> MakeDetector(std::string_view name, const DetectorContext& ctx);

} // namespace twinboot::identity
