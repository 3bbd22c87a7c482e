#pragma once

#include "links/file_system.h"
#include "links/href_resolver.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ink::links
{
// Followable links of one rendered document, in document order.
//
// Immutable once built: a content change builds a new registry that replaces the old one.
class LinkRegistry
{
public:
    LinkRegistry() = default;
    explicit LinkRegistry(std::vector<FollowableLink> links) : links_(std::move(links)) {}

    std::size_t Size() const { return links_.size(); }
    bool Empty() const { return links_.empty(); }

    // `index` must be < Size().
    const FollowableLink& At(std::size_t index) const { return links_[index]; }

    const std::vector<FollowableLink>& Links() const { return links_; }

private:
    std::vector<FollowableLink> links_;
};

// Extracts, resolves and filters every link of `markdown` (the document at `current_path`).
// Links that are not followable or have an empty label are dropped. Returns false only on a
// resolver Error, in which case `out` is left untouched and `err` describes the failure.
bool BuildLinkRegistry(const FileSystem& fs,
                       const std::string& root_dir,
                       const std::string& current_path,
                       std::string_view markdown,
                       LinkRegistry& out,
                       std::string& err);
} // namespace ink::links
