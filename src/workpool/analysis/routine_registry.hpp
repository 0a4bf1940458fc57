/**
 * @file routine_registry.hpp
 * @brief Name-keyed table of routine factories and their file scopes.
 */
#pragma once
#include "workpool/analysis/routine.hpp"

namespace workpool
{

/**
 * @brief Table of routines available to a TaskGenerator.
 *
 * @details
 * Each routine is registered under a unique name with a factory and the list
 * of file extensions it applies to (e.g. ".ts"). An empty list means the
 * routine applies to every file. Extensions are compared case-insensitively
 * and must include the leading dot.
 *
 * @par Thread Safety
 * - Concurrent const calls are safe once registration is finished.
 * - register_routine() is not thread-safe.
 */
class RoutineRegistry
{
public:
    /**
     * @brief Register a routine.
     * @throws RegistryError if @p name is empty or taken, or @p factory is empty.
     */
    void register_routine(
        const std::string& name,
        RoutineFactory factory,
        std::vector<std::string> extensions = {});

    bool contains(const std::string& name) const;

    /**
     * @brief Registered names in sorted order.
     */
    std::vector<std::string> names() const;

    /**
     * @brief Instantiate a routine.
     * @throws RegistryError if @p name is unknown or the factory returns null.
     */
    RoutinePtr create(const std::string& name) const;

    /**
     * @brief Extensions a routine applies to; empty means all files.
     * @throws RegistryError if @p name is unknown.
     */
    const std::vector<std::string>& extensions(const std::string& name) const;

    /**
     * @brief Whether routine @p name is in scope for @p path.
     * @throws RegistryError if @p name is unknown.
     */
    bool applies_to(const std::string& name, const std::string& path) const;

    size_t size() const noexcept
    {
        return m_entries.size();
    }

private:
    struct Entry
    {
        RoutineFactory factory;
        std::vector<std::string> extensions;
    };

    const Entry& entry(const std::string& name) const;

    std::map<std::string, Entry> m_entries;
};

using RoutineRegistryPtr = std::shared_ptr<const RoutineRegistry>;

/**
 * @brief Lower-cased extension of @p path including the dot, or "" if none.
 */
std::string extension_of(const std::string& path);

} // namespace workpool
