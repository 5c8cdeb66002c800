#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc commands (`set tabstop 8`).
 * Design: map name -> handler(args, msg); `set <opt>` and `set <opt>=<v>`
 * are folded into the composite name "set <opt>" before lookup.
 */
#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

class CommandRegistry {
public:
  // false with msg when the arguments are rejected
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;

  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }

  // Splits `line` on whitespace and routes it; false with msg when the
  // command is unknown or its handler fails.
  bool execute_line(const std::string& line, std::string& msg) const {
    std::istringstream iss(line);
    std::string cmd;
    if (!(iss >> cmd)) { msg = "empty command"; return false; }
    std::vector<std::string> args;
    std::string a;
    while (iss >> a) args.push_back(a);
    if (cmd == "set" && !args.empty()) {
      std::string name = args[0];
      std::vector<std::string> sub;
      size_t eq = name.find('=');
      if (eq != std::string::npos) {
        if (eq + 1 < name.size()) sub.push_back(name.substr(eq + 1));
        name = name.substr(0, eq);
      }
      for (size_t i = 1; i < args.size(); ++i) sub.push_back(args[i]);
      cmd = "set " + name;
      args.swap(sub);
    }
    auto it = map_.find(cmd);
    if (it == map_.end()) { msg = "unknown command: " + cmd; return false; }
    return it->second(args, msg);
  }

private:
  std::unordered_map<std::string, Handler> map_;
};
