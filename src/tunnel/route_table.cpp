#include "tunnel/route_table.hpp"

namespace hookrelay {

namespace {

std::string NormalizeIncomingPath(std::string_view path) {
  if (path.empty()) {
    return "/";
  }
  if (path.front() != '/') {
    return '/' + std::string(path);
  }
  return std::string(path);
}

} // namespace

std::string JoinLocalPath(std::string_view base_path,
                          std::string_view incoming) {
  const std::string normalized = NormalizeIncomingPath(incoming);
  if (base_path.empty() || base_path == "/") {
    return normalized;
  }
  if (base_path.back() == '/') {
    if (normalized.size() > 1) {
      return std::string(base_path) + normalized.substr(1);
    }
    return std::string(base_path);
  }
  if (normalized == "/") {
    return std::string(base_path);
  }
  return std::string(base_path) + normalized;
}

RouteTable::RouteTable(std::vector<Route> routes) : routes_(std::move(routes)) {
  index_.reserve(routes_.size());
  for (std::size_t i = 0; i < routes_.size(); ++i) {
    // First descriptor wins when the control plane repeats a connection.
    index_.emplace(routes_[i].connection_id, i);
  }
}

const Route *RouteTable::Find(std::string_view connection_id) const {
  auto it = index_.find(std::string(connection_id));
  if (it == index_.end()) {
    return nullptr;
  }
  return &routes_[it->second];
}

std::string RouteTable::LocalRequestTarget(const Route &route,
                                           std::string_view path,
                                           std::string_view query) {
  std::string target = JoinLocalPath(route.target.base_path, path);
  if (!query.empty()) {
    target += '?';
    target.append(query.data(), query.size());
  }
  return target;
}

} // namespace hookrelay
