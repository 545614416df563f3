#include "rc_config.hpp"
#include "file_reader.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <utility>

RcConfig::RcConfig(Settings& settings, std::vector<std::string>& diagnostics)
  : settings_(settings), diagnostics_(diagnostics) {
  register_commands();
}

void RcConfig::register_commands() {
  registry_.register_command("set log", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1) { msg = "set log: use set log <path>"; return false; }
    settings_.log_path = std::filesystem::path(args[0]);
    return true;
  });
  registry_.register_command("set loglevel", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1) { msg = "set loglevel: use set loglevel debug|info|warn|error|off"; return false; }
    auto l = parse_log_level(args[0]);
    if (!l) { msg = "set loglevel: unknown level " + args[0]; return false; }
    settings_.log_level = *l;
    return true;
  });
  registry_.register_command("set filler", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1 || args[0].size() != 1) { msg = "set filler: use set filler <char>"; return false; }
    unsigned char c = static_cast<unsigned char>(args[0][0]);
    if (!std::isprint(c)) { msg = "set filler: filler must be printable"; return false; }
    settings_.filler = static_cast<char>(c);
    return true;
  });
}

void RcConfig::execute_line(std::string s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  s = (j > i) ? s.substr(i, j - i) : std::string();
  if (s.empty()) return;
  if (s[0] == '#' || s[0] == '"') return;
  if (s[0] == ':') s.erase(s.begin());

  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    // set name=value and set name value are equivalent
    std::string name = args[0];
    std::vector<std::string> subargs;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      subargs.push_back(name.substr(eq + 1));
      name = name.substr(0, eq);
    }
    for (size_t k = 1; k < args.size(); ++k) subargs.push_back(args[k]);
    cmd = "set " + name;
    args = std::move(subargs);
  }
  std::string msg;
  if (registry_.execute(cmd, args, msg) != CommandRegistry::Result::Ok) diagnostics_.push_back(msg);
}

bool RcConfig::load_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines; std::string msg;
  if (!read_lines(path, lines, msg)) { diagnostics_.push_back(msg); return false; }
  for (auto& s : lines) execute_line(std::move(s));
  return true;
}

std::optional<std::filesystem::path> default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / WV_RC_NAME;
}
