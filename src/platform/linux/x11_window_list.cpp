// Copyright 2026 The multicap Authors
// Linux window list using the EWMH stacking order.

#include "platform/linux/x11_window_list.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>

#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include "core/logger.h"

namespace multicap {
namespace internal {

namespace {

// Layers reported in WindowInfo::layer.
constexpr int kLayerDesktop = -1;
constexpr int kLayerNormal = 0;
constexpr int kLayerPanel = 1;
constexpr int kLayerOverlay = 2;

struct Atoms {
  Atom client_list_stacking = None;
  Atom wm_pid = None;
  Atom wm_window_type = None;
  Atom type_normal = None;
  Atom type_dialog = None;
  Atom type_dock = None;
  Atom type_desktop = None;
};

Atoms InternAtoms(Display* dpy) {
  Atoms atoms;
  atoms.client_list_stacking =
      XInternAtom(dpy, "_NET_CLIENT_LIST_STACKING", True);
  atoms.wm_pid = XInternAtom(dpy, "_NET_WM_PID", True);
  atoms.wm_window_type = XInternAtom(dpy, "_NET_WM_WINDOW_TYPE", True);
  atoms.type_normal = XInternAtom(dpy, "_NET_WM_WINDOW_TYPE_NORMAL", True);
  atoms.type_dialog = XInternAtom(dpy, "_NET_WM_WINDOW_TYPE_DIALOG", True);
  atoms.type_dock = XInternAtom(dpy, "_NET_WM_WINDOW_TYPE_DOCK", True);
  atoms.type_desktop = XInternAtom(dpy, "_NET_WM_WINDOW_TYPE_DESKTOP", True);
  return atoms;
}

// Process name via _NET_WM_PID + /proc/PID/comm, else WM_CLASS.
std::string OwnerName(Display* dpy, Window w, const Atoms& atoms) {
  if (atoms.wm_pid != None) {
    Atom type;
    int fmt;
    unsigned long items, after;
    unsigned char* data = nullptr;
    if (XGetWindowProperty(dpy, w, atoms.wm_pid, 0, 1, False, XA_CARDINAL,
                           &type, &fmt, &items, &after, &data) == Success &&
        data) {
      unsigned long pid = items > 0 ? *reinterpret_cast<unsigned long*>(data)
                                    : 0;
      XFree(data);
      if (pid > 0) {
        char path[64];
        std::snprintf(path, sizeof(path), "/proc/%lu/comm", pid);
        FILE* f = std::fopen(path, "r");
        if (f) {
          char name[256] = {};
          bool ok = std::fgets(name, sizeof(name), f) != nullptr;
          std::fclose(f);
          if (ok) {
            size_t len = std::strlen(name);
            if (len > 0 && name[len - 1] == '\n') name[len - 1] = '\0';
            if (name[0] != '\0') return name;
          }
        }
      }
    }
  }

  std::string owner;
  XClassHint cls;
  if (XGetClassHint(dpy, w, &cls)) {
    if (cls.res_class) {
      owner.assign(cls.res_class);
      XFree(cls.res_class);
    }
    if (cls.res_name) XFree(cls.res_name);
  }
  return owner;
}

int WindowLayer(Display* dpy, Window w, const Atoms& atoms) {
  if (atoms.wm_window_type == None) return kLayerNormal;

  Atom type;
  int fmt;
  unsigned long items, after;
  unsigned char* data = nullptr;
  if (XGetWindowProperty(dpy, w, atoms.wm_window_type, 0, 1, False, XA_ATOM,
                         &type, &fmt, &items, &after, &data) != Success ||
      !data) {
    return kLayerNormal;  // Unset means normal.
  }
  Atom window_type = items > 0 ? *reinterpret_cast<Atom*>(data) : None;
  XFree(data);

  if (window_type == None || window_type == atoms.type_normal ||
      window_type == atoms.type_dialog) {
    return kLayerNormal;
  }
  if (window_type == atoms.type_desktop) return kLayerDesktop;
  if (window_type == atoms.type_dock) return kLayerPanel;
  return kLayerOverlay;
}

}  // namespace

X11WindowListProvider::X11WindowListProvider() = default;

X11WindowListProvider::~X11WindowListProvider() {
  if (display_) {
    XCloseDisplay(static_cast<Display*>(display_));
    display_ = nullptr;
  }
}

bool X11WindowListProvider::Initialize() {
  if (display_) return true;
  Display* dpy = XOpenDisplay(nullptr);
  if (!dpy) {
    MULTICAP_LOG_ERROR("Failed to open X11 display for window list");
    return false;
  }
  display_ = dpy;
  return true;
}

bool X11WindowListProvider::ListWindows(std::vector<WindowInfo>* out_windows) {
  if (!out_windows) return false;
  out_windows->clear();

  std::lock_guard<std::mutex> lock(mutex_);
  auto* dpy = static_cast<Display*>(display_);
  if (!dpy) return false;

  Atoms atoms = InternAtoms(dpy);
  if (atoms.client_list_stacking == None) return false;  // No EWMH WM

  int offset_x = 0;
  for (int scr = 0; scr < ScreenCount(dpy); ++scr) {
    Window root = RootWindow(dpy, scr);

    Atom type;
    int fmt;
    unsigned long items, after;
    unsigned char* data = nullptr;
    if (XGetWindowProperty(dpy, root, atoms.client_list_stacking, 0, ~0L,
                           False, XA_WINDOW, &type, &fmt, &items, &after,
                           &data) != Success ||
        !data) {
      offset_x += DisplayWidth(dpy, scr);
      continue;
    }
    auto* wins = reinterpret_cast<Window*>(data);

    // Stacking order is bottom-to-top; report topmost first.
    for (unsigned long i = items; i-- > 0;) {
      Window w = wins[i];
      XWindowAttributes a;
      if (!XGetWindowAttributes(dpy, w, &a)) continue;
      if (a.map_state != IsViewable || a.width <= 1 || a.height <= 1) {
        continue;
      }

      int ax = 0, ay = 0;
      Window child;
      XTranslateCoordinates(dpy, w, root, 0, 0, &ax, &ay, &child);

      WindowInfo info;
      info.id = static_cast<uint64_t>(w);
      info.owner_name = OwnerName(dpy, w, atoms);
      info.bounds = Rect{ax + offset_x, ay, a.width, a.height};
      info.layer = WindowLayer(dpy, w, atoms);
      out_windows->push_back(std::move(info));
    }

    XFree(data);
    offset_x += DisplayWidth(dpy, scr);
  }
  return true;
}

// Factory implementation.
std::unique_ptr<WindowListProvider> CreatePlatformWindowListProvider() {
  auto provider = std::make_unique<X11WindowListProvider>();
  if (!provider->Initialize()) return nullptr;
  return provider;
}

}  // namespace internal
}  // namespace multicap

#endif  // __linux__
