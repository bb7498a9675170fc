#pragma once

#include "include/cef_v8.h"
#include "collector/swatch_page_accessor.h"
#include <string>
#include <vector>

/**
 * SwatchCefPageAccessor - SwatchPageAccessor over a frame's V8 context.
 *
 * Runs in the renderer process on the renderer thread. The context is
 * entered for the lifetime of the accessor. Element handles index an
 * internal table of V8 values; the same DOM node always maps to the same
 * handle. JavaScript exceptions surface as std::runtime_error.
 */
class SwatchCefPageAccessor : public SwatchPageAccessor {
public:
  explicit SwatchCefPageAccessor(CefRefPtr<CefV8Context> context);
  ~SwatchCefPageAccessor() override;

  SwatchCefPageAccessor(const SwatchCefPageAccessor&) = delete;
  SwatchCefPageAccessor& operator=(const SwatchCefPageAccessor&) = delete;

  // False when the context could not be entered; every call then throws
  bool IsValid() const { return entered_; }

  int GetStyleSheetCount() override;
  StyleSheetInfo ReadStyleSheet(int index) override;

  ElementHandle GetDocumentElement() override;
  ElementHandle GetBody() override;
  std::vector<ElementHandle> QuerySelectorAll(const std::string& selector) override;
  bool Matches(ElementHandle element, const std::string& selector) override;
  ElementHandle Closest(ElementHandle element, const std::string& selector) override;
  std::vector<ChildNode> GetChildNodes(ElementHandle element) override;

  std::string GetTagName(ElementHandle element) override;
  std::string GetClassName(ElementHandle element) override;
  std::string GetTextContent(ElementHandle element) override;
  bool HasAttribute(ElementHandle element, const std::string& name) override;
  std::string GetAttribute(ElementHandle element, const std::string& name) override;
  std::vector<std::pair<std::string, std::string>> GetAttributes(ElementHandle element) override;
  std::string GetProperty(ElementHandle element, const std::string& name) override;
  ElementRect GetBoundingClientRect(ElementHandle element) override;

  std::string GetComputedStyle(ElementHandle element, const std::string& property) override;
  std::string GetInlineStyle(ElementHandle element, const std::string& property) override;
  std::string ResolveColor(const std::string& css_color) override;

private:
  CefRefPtr<CefV8Value> Document();
  CefRefPtr<CefV8Value> Element(ElementHandle element);
  ElementHandle Intern(CefRefPtr<CefV8Value> value);

  // obj[name](args...), throwing on a JavaScript exception
  CefRefPtr<CefV8Value> Call(CefRefPtr<CefV8Value> object, const std::string& method,
                             const CefV8ValueList& args);
  CefRefPtr<CefV8Value> Call(CefRefPtr<CefV8Value> object, const std::string& method,
                             const std::string& arg);
  // obj[name], throwing when the getter throws
  CefRefPtr<CefV8Value> Get(CefRefPtr<CefV8Value> object, const std::string& name);
  CefRefPtr<CefV8Value> Get(CefRefPtr<CefV8Value> object, int index);
  int Length(CefRefPtr<CefV8Value> list);

  static std::string AsString(CefRefPtr<CefV8Value> value);
  static double AsNumber(CefRefPtr<CefV8Value> value);

  CssRuleInfo ReadRule(CefRefPtr<CefV8Value> rule);

  CefRefPtr<CefV8Context> context_;
  bool entered_;
  std::vector<CefRefPtr<CefV8Value>> elements_;
  CefRefPtr<CefV8Value> color_resolver_;
};
