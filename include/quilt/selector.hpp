#pragma once

#include <quilt/result.hpp>
#include <quilt/element.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quilt {

// Resolve a local name or path to one element.
//
// Without a query the result is nullptr, meaning "operate on all elements".
// An exact local-name match wins immediately (first one in order). Otherwise
// the query's real path is compared against every element's real path and
// the last matching element is returned. No match is a Selection error.
Result<const Element*> select_element(const std::vector<std::unique_ptr<Element>>& elements,
                                      const std::optional<std::string>& local_name_or_path);

} // namespace quilt
