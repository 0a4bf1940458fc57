#include "workpool/analysis/routine_registry.hpp"
#include "workpool/common/pool_errors.hpp"

#include <cctype>
#include <filesystem>

namespace workpool
{

namespace
{

std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::string extension_of(const std::string& path)
{
    return to_lower(std::filesystem::path(path).extension().string());
}

void RoutineRegistry::register_routine(
    const std::string& name,
    RoutineFactory factory,
    std::vector<std::string> extensions)
{
    if (name.empty())
    {
        throw RegistryError("Routine name must not be empty");
    }
    if (!factory)
    {
        throw RegistryError("Routine factory for '" + name + "' is empty");
    }
    for (auto& ext : extensions)
    {
        if (ext.empty() || ext.front() != '.')
        {
            throw RegistryError("Routine '" + name + "' has invalid extension '" + ext + "'");
        }
        ext = to_lower(ext);
    }

    auto inserted = m_entries.emplace(name, Entry{std::move(factory), std::move(extensions)});
    if (!inserted.second)
    {
        throw RegistryError("Routine already registered: " + name);
    }
}

bool RoutineRegistry::contains(const std::string& name) const
{
    return m_entries.find(name) != m_entries.end();
}

std::vector<std::string> RoutineRegistry::names() const
{
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& kv : m_entries)
    {
        result.push_back(kv.first);
    }
    return result;
}

RoutinePtr RoutineRegistry::create(const std::string& name) const
{
    RoutinePtr routine = entry(name).factory();
    if (!routine)
    {
        throw RegistryError("Routine factory for '" + name + "' returned null");
    }
    return routine;
}

const std::vector<std::string>& RoutineRegistry::extensions(const std::string& name) const
{
    return entry(name).extensions;
}

bool RoutineRegistry::applies_to(const std::string& name, const std::string& path) const
{
    const auto& exts = entry(name).extensions;
    if (exts.empty())
    {
        return true;
    }
    return std::find(exts.begin(), exts.end(), extension_of(path)) != exts.end();
}

const RoutineRegistry::Entry& RoutineRegistry::entry(const std::string& name) const
{
    auto it = m_entries.find(name);
    if (it == m_entries.end())
    {
        throw RegistryError("Unknown routine: " + name);
    }
    return it->second;
}

} // namespace workpool
