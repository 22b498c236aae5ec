#include "livephoto/tag_snapshot.h"

namespace livephoto {
namespace {

    static bool continues_tree(std::string_view candidate,
                               std::string_view root) noexcept
    {
        if (candidate.size() <= root.size()
            || candidate.substr(0, root.size()) != root) {
            return false;
        }
        const char next = candidate[root.size()];
        return next == '[' || next == '/';
    }

}  // namespace

const std::string*
TagSnapshot::find(std::string_view key) const noexcept
{
    const auto it = map_.find(key);
    if (it == map_.end()) {
        return nullptr;
    }
    return &it->second;
}


std::string_view
TagSnapshot::get(std::string_view key) const noexcept
{
    const std::string* v = find(key);
    return v ? std::string_view(*v) : std::string_view {};
}


bool
TagSnapshot::contains(std::string_view key) const noexcept
{
    return map_.find(key) != map_.end();
}


void
TagSnapshot::set(std::string_view key, std::string_view value)
{
    const auto it = map_.find(key);
    if (it != map_.end()) {
        it->second.assign(value.data(), value.size());
        return;
    }
    map_.emplace(std::string(key), std::string(value));
}


bool
TagSnapshot::erase(std::string_view key) noexcept
{
    const auto it = map_.find(key);
    if (it == map_.end()) {
        return false;
    }
    map_.erase(it);
    return true;
}


uint32_t
TagSnapshot::erase_tree(std::string_view key) noexcept
{
    uint32_t removed = erase(key) ? 1U : 0U;
    auto it          = map_.lower_bound(key);
    while (it != map_.end()) {
        const std::string_view k(it->first);
        if (k.substr(0, key.size()) != key) {
            break;
        }
        if (continues_tree(k, key)) {
            it = map_.erase(it);
            removed += 1;
        } else {
            ++it;
        }
    }
    return removed;
}


void
TagSnapshot::clear() noexcept
{
    map_.clear();
}


size_t
TagSnapshot::size() const noexcept
{
    return map_.size();
}


bool
TagSnapshot::empty() const noexcept
{
    return map_.empty();
}


TagSnapshot::const_iterator
TagSnapshot::begin() const noexcept
{
    return map_.begin();
}


TagSnapshot::const_iterator
TagSnapshot::end() const noexcept
{
    return map_.end();
}


std::vector<std::string>
TagSnapshot::keys() const
{
    std::vector<std::string> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) {
        out.push_back(kv.first);
    }
    return out;
}

}  // namespace livephoto
