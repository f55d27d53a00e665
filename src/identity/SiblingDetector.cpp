#include "identity/SiblingDetector.h"

#include "io/AtomicFile.h"

#include <system_error>
#include <utility>

namespace twinboot::identity {

namespace {

// Labels come from a hand-edited text file; drop the trailing newline an
// editor adds and surrounding blanks. Sanitization happens later.
std::string TrimLine(std::string s)
{
    auto is_blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!s.empty() && is_blank(s.back()))
        s.pop_back();
    std::size_t start = 0;
    while (start < s.size() && is_blank(s[start]))
        ++start;
    return s.substr(start);
}

} // namespace

// --- VirtualCloneDetector ------------------------------------------------------

VirtualCloneDetector::VirtualCloneDetector(std::vector<std::string> args)
    : m_args(std::move(args))
{
}

bool VirtualCloneDetector::IsSecondaryInstance() const
{
    for (const auto& a : m_args)
    {
        if (a == kCloneFlag)
            return true;
    }
    return false;
}

std::string VirtualCloneDetector::Label() const
{
    std::string label;
    for (std::size_t i = 0; i + 1 < m_args.size(); ++i)
    {
        if (m_args[i] == kNameFlag)
            label += m_args[i + 1];
    }
    return label;
}

// --- CloneMarkerDetector -------------------------------------------------------

CloneMarkerDetector::CloneMarkerDetector(std::filesystem::path projectDir)
    : m_projectDir(std::move(projectDir))
{
}

bool CloneMarkerDetector::IsSecondaryInstance() const
{
    std::error_code ec;
    return std::filesystem::exists(m_projectDir / kMarkerFile, ec) && !ec;
}

std::string CloneMarkerDetector::Label() const
{
    std::string text;
    if (!io::read_all(m_projectDir / kArgumentFile, text, nullptr, nullptr, 4096))
        return {};
    return TrimLine(std::move(text));
}

// --- factory -------------------------------------------------------------------

std::unique_ptr<ISiblingDetector> MakeDetector(std::string_view name, const DetectorContext& ctx)
{
    if (name == "none")
        return std::make_unique<NoneActiveDetector>();
    if (name == "virtual-clone")
        return std::make_unique<VirtualCloneDetector>(ctx.args);
    if (name == "clone-marker")
        return std::make_unique<CloneMarkerDetector>(ctx.projectDir.empty() ? std::filesystem::path(".") : ctx.projectDir);
    return nullptr;
}

} // namespace twinboot::identity
