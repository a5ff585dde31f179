#pragma once

#include <functional>
#include <string>

namespace notemarker {

/**
 * Receives formatted log lines ("[level] message"). When unset, lines are
 * written to stderr with a "[notemarker]" prefix.
 */
using LogCallback = std::function<void(const std::string&)>;

}  // namespace notemarker
