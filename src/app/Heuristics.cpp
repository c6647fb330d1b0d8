#include "app/Heuristics.hpp"

#include <charconv>
#include <string>
#include <unordered_set>

namespace netsentry::app {

namespace {

using NameSet = std::unordered_set<std::string_view>;

const NameSet& system_processes() {
  static const NameSet set = {
    // core system
    "kernel_task", "launchd", "WindowServer", "loginwindow",
    "mds", "mds_stores", "trustd", "syslogd", "configd",
    "securityd", "coreauthd", "UserEventAgent", "distnoted",
    "systemd", "systemd-resolved", "systemd-networkd", "systemd-timesyncd",
    "init", "kthreadd", "dbus-daemon", "sshd", "NetworkManager",
    // networking
    "rapportd", "sharingd", "identityservicesd", "symptomsd",
    "networkd", "bluetoothd", "airportd", "mDNSResponder",
    "netbiosd", "WiFiAgent", "avahi-daemon", "wpa_supplicant", "dhclient",
    // vendor services
    "apsd", "cloudd", "nsurlsessiond", "CommCenter", "bird",
    "locationd", "timed", "assistantd", "siriknowledged",
    "searchpartyd", "findmydeviced", "familycircled",
    // media & sync
    "mediaremoted", "AMPDeviceDiscoveryAgent", "photoanalysisd",
    "IMTransferAgent", "calaccessd", "remindd",
    // updates & store
    "softwareupdated", "storeassetd", "storedownloadd",
    // misc daemons
    "accountsd", "akd", "biomesyncd", "coreduetd",
    "suggestd", "parsecd", "lsd", "mdworker", "usernoted",
  };
  return set;
}

const NameSet& known_apps() {
  static const NameSet set = {
    // browsers
    "Safari", "Google Chrome", "Google Chrome Helper",
    "Firefox", "firefox", "Brave Browser", "Arc", "Microsoft Edge",
    "Opera", "Vivaldi", "Orion", "chrome", "chromium",
    // communication
    "Slack", "Discord", "Messages", "FaceTime", "zoom.us",
    "Telegram", "WhatsApp", "Signal", "Microsoft Teams",
    "Skype", "Webex",
    // email
    "Mail", "Outlook", "Spark", "Thunderbird", "thunderbird",
    // media & streaming
    "Spotify", "spotify", "Music", "Podcasts", "TV", "VLC", "vlc",
    // cloud & sync
    "Finder", "Dropbox", "dropbox", "Google Drive", "OneDrive",
    "iCloud", "Box",
    // productivity
    "Notes", "Maps", "Calendar", "Reminders",
    "Notion", "Obsidian", "Bear",
    // password managers
    "1Password", "Bitwarden",
    // development
    "Code Helper", "code", "node", "python3", "python", "curl",
    "git-remote-https", "Xcode", "Docker", "dockerd", "Postman",
    "npm", "yarn", "ruby", "php", "java", "go",
    "Terminal", "iTerm2", "Warp", "ssh", "wget",
    // system apps
    "App Store", "System Preferences", "System Settings",
    "Preview", "TextEdit", "Photo Booth",
    // gaming
    "Steam", "Steam Helper", "steam",
  };
  return set;
}

const NameSet& suspicious_ports() {
  static const NameSet set = {"4444", "5555", "6666", "1337", "31337", "8888"};
  return set;
}

bool parse_port(std::string_view s, int& out) {
  if (s.empty()) return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

} // namespace

bool is_suspicious_port(std::string_view port) {
  return suspicious_ports().count(port) != 0;
}

bool is_system_process(std::string_view name) {
  return system_processes().count(name) != 0;
}

bool is_known_process(std::string_view name) {
  return known_apps().count(name) != 0 || is_system_process(name);
}

bool can_kill(std::string_view name) {
  return !is_system_process(name);
}

bool evaluate_suspicion(std::string_view process_name,
                        std::string_view remote_port,
                        std::string_view /*remote_address*/) {
  if (is_suspicious_port(remote_port)) return true;
  int port = 0;
  if (parse_port(remote_port, port) && port > kEphemeralPortThreshold && !is_known_process(process_name)) {
    return true;
  }
  return false;
}

std::string service_label(std::string_view p) {
  if (p == "443") return "Secure web (HTTPS)";
  if (p == "80") return "Web (HTTP)";
  if (p == "53") return "DNS lookup";
  if (p == "993" || p == "143") return "Email (IMAP)";
  if (p == "587" || p == "465" || p == "25") return "Email (SMTP)";
  if (p == "22") return "SSH";
  if (p == "5228" || p == "5223") return "Push notifications";
  if (p == "3478" || p == "3479") return "Video/voice call";
  if (p == "8443") return "Secure web (alt)";
  if (p == "8080") return "Web proxy";
  if (p == "123") return "Time sync (NTP)";
  if (p == "*") return "Listening";
  int port = 0;
  if (parse_port(p, port) && port > kEphemeralPortThreshold) return "High port " + std::string(p);
  return "Port " + std::string(p);
}

} // namespace netsentry::app
