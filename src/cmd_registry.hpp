#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch config commands by name.
 * Design: map name → handler(args, msg); a handler returns false and fills
 *         msg when its arguments are rejected.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <utility>
#include <vector>

class CommandRegistry {
public:
  enum class Result { Ok, Rejected, Unknown };
  using Handler = std::function<bool(const std::vector<std::string>& args, std::string& msg)>;

  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  Result execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return Result::Unknown; }
    return it->second(args, msg) ? Result::Ok : Result::Rejected;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
