#include "links/link_registry.h"

#include "links/link_extractor.h"

#include "core/strings.h"

namespace ink::links
{
bool BuildLinkRegistry(const FileSystem& fs,
                       const std::string& root_dir,
                       const std::string& current_path,
                       std::string_view markdown,
                       LinkRegistry& out,
                       std::string& err)
{
    err.clear();
    const std::vector<RawLink> raw = ExtractRawLinks(markdown);

    std::vector<FollowableLink> links;
    links.reserve(raw.size());
    for (const RawLink& r : raw)
    {
        FollowableLink link;
        const ResolveOutcome outcome = ResolveFollowableLink(fs, root_dir, current_path, r.href, link, err);
        if (outcome == ResolveOutcome::Error)
            return false;
        if (outcome != ResolveOutcome::Followable)
            continue;
        if (TrimView(r.label).empty())
            continue;
        link.label = r.label;
        links.push_back(std::move(link));
    }

    out = LinkRegistry(std::move(links));
    return true;
}
} // namespace ink::links
