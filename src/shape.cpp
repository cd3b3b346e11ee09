/**
 * @file shape.cpp
 * @brief Cursor name to cursor type mapping.
 */

#include <luuma-cursor/shape.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unordered_map>

namespace luuma::cursor {

namespace {

// X cursor font names, Xcursor theme aliases and CSS cursor names all end up
// in the XFixes cursor name atom depending on the toolkit, so each label
// collects all three spellings.
const std::unordered_map<std::string, std::string> &nameTable() {
  static const std::unordered_map<std::string, std::string> table = {
      // arrow
      {"left_ptr", "arrow"},
      {"default", "arrow"},
      {"arrow", "arrow"},
      {"top_left_arrow", "arrow"},
      {"right_ptr", "arrow"},
      // ibeam
      {"xterm", "ibeam"},
      {"text", "ibeam"},
      {"ibeam", "ibeam"},
      {"vertical-text", "ibeam"},
      // hand
      {"hand", "hand"},
      {"hand1", "hand"},
      {"hand2", "hand"},
      {"pointer", "hand"},
      {"pointing_hand", "hand"},
      // wait
      {"watch", "wait"},
      {"wait", "wait"},
      // cross
      {"crosshair", "cross"},
      {"cross", "cross"},
      {"tcross", "cross"},
      {"cross_reverse", "cross"},
      {"diamond_cross", "cross"},
      // up_arrow
      {"up_arrow", "up_arrow"},
      {"center_ptr", "up_arrow"},
      {"sb_up_arrow", "up_arrow"},
      // size
      {"size", "size"},
      // size_nw_se
      {"size_nw_se", "size_nw_se"},
      {"nwse-resize", "size_nw_se"},
      {"nw-resize", "size_nw_se"},
      {"se-resize", "size_nw_se"},
      {"size_fdiag", "size_nw_se"},
      {"bd_double_arrow", "size_nw_se"},
      {"top_left_corner", "size_nw_se"},
      {"bottom_right_corner", "size_nw_se"},
      // size_ne_sw
      {"size_ne_sw", "size_ne_sw"},
      {"nesw-resize", "size_ne_sw"},
      {"ne-resize", "size_ne_sw"},
      {"sw-resize", "size_ne_sw"},
      {"size_bdiag", "size_ne_sw"},
      {"fd_double_arrow", "size_ne_sw"},
      {"top_right_corner", "size_ne_sw"},
      {"bottom_left_corner", "size_ne_sw"},
      // size_we
      {"size_we", "size_we"},
      {"ew-resize", "size_we"},
      {"e-resize", "size_we"},
      {"w-resize", "size_we"},
      {"col-resize", "size_we"},
      {"size_hor", "size_we"},
      {"h_double_arrow", "size_we"},
      {"sb_h_double_arrow", "size_we"},
      {"left_side", "size_we"},
      {"right_side", "size_we"},
      // size_ns
      {"size_ns", "size_ns"},
      {"ns-resize", "size_ns"},
      {"n-resize", "size_ns"},
      {"s-resize", "size_ns"},
      {"row-resize", "size_ns"},
      {"size_ver", "size_ns"},
      {"v_double_arrow", "size_ns"},
      {"sb_v_double_arrow", "size_ns"},
      {"top_side", "size_ns"},
      {"bottom_side", "size_ns"},
      // size_all
      {"size_all", "size_all"},
      {"fleur", "size_all"},
      {"move", "size_all"},
      {"all-scroll", "size_all"},
      // no
      {"no", "no"},
      {"not-allowed", "no"},
      {"no-drop", "no"},
      {"forbidden", "no"},
      {"crossed_circle", "no"},
      {"circle", "no"},
      // app_starting
      {"app_starting", "app_starting"},
      {"progress", "app_starting"},
      {"left_ptr_watch", "app_starting"},
      {"half-busy", "app_starting"},
      // help
      {"help", "help"},
      {"question_arrow", "help"},
      {"whats_this", "help"},
      {"left_ptr_help", "help"},
      // pin
      {"pin", "pin"},
      // person
      {"person", "person"},
  };
  return table;
}

} // namespace

const std::vector<std::string> &knownCursorTypes() {
  static const std::vector<std::string> types = {
      "arrow",    "ibeam",   "hand",         "wait",  "cross", "up_arrow",
      "size",     "size_nw_se", "size_ne_sw", "size_we", "size_ns",
      "size_all", "no",      "app_starting", "help",  "pin",   "person",
  };
  return types;
}

std::string cursorTypeForName(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  const auto &table = nameTable();
  auto it = table.find(lower);
  if (it == table.end())
    return std::string();
  return it->second;
}

std::string customCursorType(ShapeHandle handle) {
  char buf[40];
  std::snprintf(buf, sizeof(buf), "custom_0x%llx",
                static_cast<unsigned long long>(handle));
  return std::string(buf);
}

} // namespace luuma::cursor
