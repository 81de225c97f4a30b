/**
 * @file profile.cpp
 * @brief Implementation of the scoped timers described in profile.hpp
 */

#include "asteroids/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& section  = instance.sections[name];
    section.start_time = Clock::now();

    if (!instance.scope_stack.empty()) {
        const std::string parentName = instance.scope_stack.back();
        if (section.profile_data.parent_name.empty()) {
            section.profile_data.parent_name = parentName;
            auto& siblings = instance.sections[parentName].profile_data.children;
            if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
                siblings.push_back(name);
            }
        }
    }

    instance.scope_stack.push_back(name);
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.scope_stack.empty() || instance.scope_stack.back() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") does not match the open scope.\n";
        return;
    }

    auto& data = instance.sections[name].profile_data;
    Duration const elapsed =
        std::chrono::duration_cast<Duration>(Clock::now() - instance.sections[name].start_time);

    data.total_time += elapsed;
    data.max_time = std::max(data.max_time, elapsed);
    data.call_count += 1;

    instance.scope_stack.pop_back();
}

void Profiler::printStats(std::ostream& out) {
    auto& instance = getInstance();
    out << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    for (const auto& [name, section] : instance.sections) {
        if (section.profile_data.parent_name.empty()) {
            roots.push_back(name);
        }
    }
    std::sort(roots.begin(), roots.end());

    for (std::size_t i = 0; i < roots.size(); ++i) {
        printNode(out, roots[i], "", i == roots.size() - 1);
    }
}

void Profiler::printNode(std::ostream& out,
                         const std::string& name,
                         const std::string& prefix,
                         bool is_last) {
    const auto& pd = getInstance().sections.at(name).profile_data;

    double const totalMs = std::chrono::duration<double, std::milli>(pd.total_time).count();
    double const avgUs = pd.call_count > 0
        ? std::chrono::duration<double, std::micro>(pd.total_time).count() / static_cast<double>(pd.call_count)
        : 0.0;
    double const maxUs = std::chrono::duration<double, std::micro>(pd.max_time).count();

    out << prefix << (is_last ? "└── " : "├── ")
        << name << " [" << pd.call_count << " calls] "
        << std::fixed << std::setprecision(2) << totalMs << "ms (avg " << avgUs
        << "us, max " << maxUs << "us)\n";

    for (std::size_t i = 0; i < pd.children.size(); ++i) {
        std::string const childPrefix = prefix + (is_last ? "    " : "│   ");
        printNode(out, pd.children[i], childPrefix, i == pd.children.size() - 1);
    }
}

std::uint64_t Profiler::callCount(const std::string& name) {
    const auto& sections = getInstance().sections;
    auto it = sections.find(name);
    return it == sections.end() ? 0 : it->second.profile_data.call_count;
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.scope_stack.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
