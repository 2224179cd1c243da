/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Operation - Operation type detection for incoming documents
 */

#ifndef QCACHE_PROXY_OPERATION_HPP
#define QCACHE_PROXY_OPERATION_HPP

#include "cache/request_context.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace qcache::proxy {

/**
 * Type of the operation a request will execute
 *
 * Scans the top-level definitions of the document (comments, strings and
 * nested selection sets are skipped; fragments are ignored). The operation
 * is chosen by name, or is the only operation of the document. A bare
 * selection set "{ ... }" is an anonymous query.
 *
 * @return nullopt if no operation matches or the choice is ambiguous
 */
std::optional<cache::OperationType> detect_operation_type(std::string_view document,
                                                          const std::optional<std::string>& operation_name);

} // namespace qcache::proxy

#endif // QCACHE_PROXY_OPERATION_HPP
