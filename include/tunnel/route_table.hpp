#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "session/forward_target.hpp"

namespace hookrelay {

struct Route {
  std::string connection_id;
  std::string connection_name;
  std::string source_id;
  std::string source_name;
  // Public ingest URL of the source.
  std::string source_url;
  // Destination CLI path configured remotely; display only.
  std::string cli_path{"/"};
  ForwardTarget target;
};

// Connection id -> Route. Built once per transport epoch and never mutated
// afterwards; share it through RouteTablePtr.
class RouteTable {
public:
  RouteTable() = default;
  explicit RouteTable(std::vector<Route> routes);

  const Route *Find(std::string_view connection_id) const;
  const std::vector<Route> &routes() const { return routes_; }
  std::size_t size() const { return routes_.size(); }
  bool empty() const { return routes_.empty(); }

  // Request target for the local server: target base path + inbound path,
  // followed by "?query" when the query is non-empty.
  static std::string LocalRequestTarget(const Route &route,
                                        std::string_view path,
                                        std::string_view query);

private:
  std::vector<Route> routes_;
  std::unordered_map<std::string, std::size_t> index_;
};

using RouteTablePtr = std::shared_ptr<const RouteTable>;

std::string JoinLocalPath(std::string_view base_path, std::string_view incoming);

} // namespace hookrelay
