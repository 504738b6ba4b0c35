/**
 * @file profile.cpp
 * @brief Implementation of the scope profiler declared in profile.hpp
 */

#include "swarm/core/profile.hpp"

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
    auto& data = instance.sections[name];

    if (!instance.scope_stack.empty()) {
        const std::string& parent = instance.scope_stack.back();
        if (data.parent_name != parent) {
            data.parent_name = parent;
            auto& siblings = instance.sections[parent].children;
            if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
                siblings.push_back(name);
            }
        }
    }

    instance.open_sections[name] = Clock::now();
    instance.scope_stack.push_back(name);
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.scope_stack.empty() || instance.scope_stack.back() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") does not match the innermost open scope.\n";
        return;
    }

    auto const started = instance.open_sections[name];
    Duration const elapsed = std::chrono::duration_cast<Duration>(Clock::now() - started);

    auto& data = instance.sections[name];
    data.total_time += elapsed;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, elapsed);
    data.max_time = std::max(data.max_time, elapsed);

    instance.open_sections.erase(name);
    instance.scope_stack.pop_back();
}

std::uint64_t Profiler::callCount(const std::string& name) {
    const auto& instance = getInstance();
    auto it = instance.sections.find(name);
    return it == instance.sections.end() ? 0 : it->second.call_count;
}

void Profiler::printStats(std::ostream& out) {
    const auto& instance = getInstance();
    out << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    for (const auto& [name, data] : instance.sections) {
        if (data.parent_name.empty()) {
            roots.push_back(name);
        }
    }
    std::sort(roots.begin(), roots.end());

    for (const auto& root : roots) {
        instance.printNode(out, root, 0);
    }
}

void Profiler::printNode(std::ostream& out, const std::string& name, int depth) const {
    const auto& data = sections.at(name);

    double const totalMs = std::chrono::duration<double, std::milli>(data.total_time).count();
    double const avgMs = data.call_count > 0 ? totalMs / static_cast<double>(data.call_count) : 0.0;

    out << std::string(static_cast<std::size_t>(depth) * 2, ' ')
        << name << " [" << data.call_count << " calls] "
        << std::fixed << std::setprecision(3)
        << totalMs << "ms total, " << avgMs << "ms avg\n";

    for (const auto& child : data.children) {
        printNode(out, child, depth + 1);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.open_sections.clear();
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
