//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BLECENTRAL_CENTRAL_RESOURCE_REGISTRY_HPP_INCLUDED
#define BLECENTRAL_CENTRAL_RESOURCE_REGISTRY_HPP_INCLUDED

#include <blecentral/sdk/uuid.hpp>

#include <cstddef>
#include <list>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace blecentral
{
namespace central
{

/// Ordered set of identifiers (first insertion order, duplicates ignored).
///
class IdentifierSet final
{
public:
    using const_iterator = std::vector<sdk::Uuid>::const_iterator;

    bool insert(const sdk::Uuid& id)
    {
        if (!members_.insert(id).second)
        {
            return false;
        }
        ordered_.push_back(id);
        return true;
    }

    bool contains(const sdk::Uuid& id) const
    {
        return members_.find(id) != members_.end();
    }

    void clear() noexcept
    {
        members_.clear();
        ordered_.clear();
    }

    std::size_t size() const noexcept
    {
        return ordered_.size();
    }

    bool empty() const noexcept
    {
        return ordered_.empty();
    }

    const_iterator begin() const noexcept
    {
        return ordered_.cbegin();
    }

    const_iterator end() const noexcept
    {
        return ordered_.cend();
    }

private:
    std::unordered_set<sdk::Uuid> members_;
    std::vector<sdk::Uuid>        ordered_;

};  // IdentifierSet

/// Keyed store of discovered resources.
///
/// Natural order of the registry is "the most recently upserted last": an upsert of a known
/// identifier replaces the resource and moves the entry to the end. So, enumeration of resources
/// discovered by one round follows the order in which the round has reported them.
///
template <typename Resource>
class ResourceRegistry final
{
public:
    using ResourcePtr = std::shared_ptr<Resource>;

    /// Inserts the resource, or replaces the one known for the identifier.
    ///
    /// @return The replaced resource (if any). It is handed over (rather than released in place),
    ///         so its destruction can't observe the registry in the middle of the update.
    ///
    ResourcePtr upsert(const sdk::Uuid& id, ResourcePtr resource)
    {
        ResourcePtr replaced;
        const auto  it = id_to_entry_.find(id);
        if (it != id_to_entry_.end())
        {
            replaced = std::move(it->second->second);
            entries_.erase(it->second);
            id_to_entry_.erase(it);
        }
        entries_.emplace_back(id, std::move(resource));
        id_to_entry_.emplace(id, std::prev(entries_.end()));
        return replaced;
    }

    /// @return The resource, or `nullptr` if the identifier is unknown.
    ///
    ResourcePtr lookup(const sdk::Uuid& id) const
    {
        const auto it = id_to_entry_.find(id);
        return (it != id_to_entry_.end()) ? it->second->second : nullptr;
    }

    /// Enumerates resources (in the natural order) which identifiers are members of the given scope.
    ///
    template <typename Scope>
    std::vector<ResourcePtr> enumerate(const Scope& scoped_ids) const
    {
        std::vector<ResourcePtr> resources;
        resources.reserve(scoped_ids.size());
        for (const auto& entry : entries_)
        {
            if (scoped_ids.contains(entry.first))
            {
                resources.push_back(entry.second);
            }
        }
        return resources;
    }

    /// Gets all resources (in the natural order).
    ///
    std::vector<ResourcePtr> all() const
    {
        std::vector<ResourcePtr> resources;
        resources.reserve(entries_.size());
        for (const auto& entry : entries_)
        {
            resources.push_back(entry.second);
        }
        return resources;
    }

    std::size_t size() const noexcept
    {
        return entries_.size();
    }

    void clear()
    {
        // Resources are released only once the registry is empty.
        auto entries = std::move(entries_);
        entries_.clear();
        id_to_entry_.clear();
    }

private:
    using Entry = std::pair<sdk::Uuid, ResourcePtr>;

    std::list<Entry>                                                 entries_;
    std::unordered_map<sdk::Uuid, typename std::list<Entry>::iterator> id_to_entry_;

};  // ResourceRegistry

}  // namespace central
}  // namespace blecentral

#endif  // BLECENTRAL_CENTRAL_RESOURCE_REGISTRY_HPP_INCLUDED
