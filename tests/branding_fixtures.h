#pragma once

#include "core/swatch_branding_types.h"
#include <string>

// Snapshot builders shared by the inference, merge and pipeline tests

inline StyleSnapshot MakeButtonSnapshot(const std::string& text, const std::string& background,
                                        const std::string& classes = "btn",
                                        double w = 120, double h = 40) {
  StyleSnapshot snap;
  snap.tag = "button";
  snap.classes = classes;
  snap.text = text;
  snap.rect.w = w;
  snap.rect.h = h;
  snap.colors.text = "rgb(255, 255, 255)";
  snap.colors.background = background;
  snap.colors.border = "rgb(0, 0, 0)";
  snap.colors.border_width = 0.0;
  snap.has_radius = true;
  snap.radius = 6.0;
  snap.is_button = true;
  return snap;
}

inline StyleSnapshot MakeTextSnapshot(const std::string& tag, const std::string& color,
                                      const std::string& family = "Inter") {
  StyleSnapshot snap;
  snap.tag = tag;
  snap.text = "Lorem ipsum";
  snap.rect.w = 600;
  snap.rect.h = 24;
  snap.colors.text = color;
  snap.colors.background = "rgba(0, 0, 0, 0)";
  snap.typography.family = family;
  snap.typography.font_stack = {family, "sans-serif"};
  snap.typography.size = "16px";
  snap.typography.weight = 400;
  snap.is_link = tag == "a";
  return snap;
}

inline StyleSnapshot MakeInputSnapshot(const std::string& border, double radius) {
  StyleSnapshot snap;
  snap.tag = "input";
  snap.rect.w = 240;
  snap.rect.h = 36;
  snap.colors.text = "rgb(17, 17, 17)";
  snap.colors.background = "rgb(255, 255, 255)";
  snap.colors.border = border;
  snap.colors.border_width = 1.0;
  snap.has_radius = true;
  snap.radius = radius;
  snap.is_input = true;
  return snap;
}

inline ButtonCandidate MakeCandidate(const std::string& text, const std::string& background,
                                     const std::string& classes = "btn", double area = 4800,
                                     const std::string& border = "",
                                     const std::string& radius = "6px") {
  ButtonCandidate candidate;
  candidate.text = text;
  candidate.background = background;
  candidate.classes = classes;
  candidate.area = area;
  candidate.border_color = border;
  candidate.border_radius = radius;
  candidate.text_color = "#FFFFFF";
  candidate.signature = text + "|" + background + "|" + classes;
  return candidate;
}
