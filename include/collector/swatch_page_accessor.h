#pragma once

#include <string>
#include <utility>
#include <vector>

// Opaque element reference handed out by a page accessor. Handles are only
// meaningful to the accessor that produced them.
using ElementHandle = int;
constexpr ElementHandle kNoElement = -1;

struct ElementRect {
  double x = 0.0;
  double y = 0.0;  // top, relative to the viewport
  double width = 0.0;
  double height = 0.0;
};

enum class CssRuleType {
  STYLE,
  FONT_FACE,
  OTHER
};

// One CSS rule as exposed by the CSSOM. A rule whose declarations could not
// be read carries a non-empty error.
struct CssRuleInfo {
  CssRuleType type = CssRuleType::OTHER;
  std::vector<std::pair<std::string, std::string>> declarations;  // property -> value
  std::string error;
};

// Result of reading one document.styleSheets entry. Cross-origin sheets
// refuse cssRules access; those come back with accessible == false.
struct StyleSheetInfo {
  bool accessible = false;
  std::string href;
  std::string error;
  std::vector<CssRuleInfo> rules;
};

// A child of an element: either an element or a text node
struct ChildNode {
  ElementHandle element = kNoElement;
  std::string text;
};

/**
 * SwatchPageAccessor - read-only view of a rendered page.
 *
 * Implemented by the browser automation layer (see SwatchCefPageAccessor)
 * and by fixtures in tests. Selectors follow document.querySelectorAll
 * semantics. Implementations may throw std::exception from any method; the
 * collector treats that as a fault of the item being read.
 */
class SwatchPageAccessor {
public:
  virtual ~SwatchPageAccessor() = default;

  // Stylesheets
  virtual int GetStyleSheetCount() = 0;
  virtual StyleSheetInfo ReadStyleSheet(int index) = 0;

  // Document structure
  virtual ElementHandle GetDocumentElement() = 0;
  virtual ElementHandle GetBody() = 0;
  virtual std::vector<ElementHandle> QuerySelectorAll(const std::string& selector) = 0;
  virtual bool Matches(ElementHandle element, const std::string& selector) = 0;
  // Nearest inclusive ancestor matching the selector, or kNoElement
  virtual ElementHandle Closest(ElementHandle element, const std::string& selector) = 0;
  virtual std::vector<ChildNode> GetChildNodes(ElementHandle element) = 0;

  // Element data
  virtual std::string GetTagName(ElementHandle element) = 0;
  // className, or className.baseVal for SVG elements
  virtual std::string GetClassName(ElementHandle element) = 0;
  virtual std::string GetTextContent(ElementHandle element) = 0;
  virtual bool HasAttribute(ElementHandle element, const std::string& name) = 0;
  virtual std::string GetAttribute(ElementHandle element, const std::string& name) = 0;
  // All attributes in document order
  virtual std::vector<std::pair<std::string, std::string>> GetAttributes(ElementHandle element) = 0;
  // Resolved DOM property such as img.src, link.href or meta.content
  virtual std::string GetProperty(ElementHandle element, const std::string& name) = 0;
  virtual ElementRect GetBoundingClientRect(ElementHandle element) = 0;

  // Styles
  virtual std::string GetComputedStyle(ElementHandle element, const std::string& property) = 0;
  // element.style.getPropertyValue(property)
  virtual std::string GetInlineStyle(ElementHandle element, const std::string& property) = 0;

  /**
   * Canvas fillStyle round trip: assign the value to a 2D context's
   * fillStyle and read it back. Returns "" when the page cannot resolve it.
   */
  virtual std::string ResolveColor(const std::string& css_color) = 0;

  // First match, or kNoElement
  virtual ElementHandle QuerySelector(const std::string& selector) {
    std::vector<ElementHandle> all = QuerySelectorAll(selector);
    return all.empty() ? kNoElement : all.front();
  }
};
