#include "automation/swatch_cef_page_accessor.h"
#include "util/logger.h"
#include "include/wrapper/cef_helpers.h"
#include <stdexcept>

namespace {

// CSSRule.type
constexpr int kStyleRule = 1;
constexpr int kFontFaceRule = 5;

// Assigning an unknown value leaves fillStyle unchanged, so probe with two
// different sentinels
const char kColorResolverScript[] =
    "(function(value) {"
    "  var ctx = document.createElement('canvas').getContext('2d');"
    "  if (!ctx) return '';"
    "  ctx.fillStyle = '#010203'; ctx.fillStyle = value; var a = ctx.fillStyle;"
    "  ctx.fillStyle = '#040506'; ctx.fillStyle = value; var b = ctx.fillStyle;"
    "  return a === b ? String(a) : '';"
    "})";

}  // namespace

SwatchCefPageAccessor::SwatchCefPageAccessor(CefRefPtr<CefV8Context> context)
    : context_(context),
      entered_(false) {
  CEF_REQUIRE_RENDERER_THREAD();
  if (context_ && context_->Enter()) {
    entered_ = true;
  } else {
    LOG_ERROR("CefPageAccessor", "Failed to enter V8 context");
  }
}

SwatchCefPageAccessor::~SwatchCefPageAccessor() {
  elements_.clear();
  color_resolver_ = nullptr;
  if (entered_) {
    context_->Exit();
  }
}

// ============================================================================
// V8 helpers
// ============================================================================

CefRefPtr<CefV8Value> SwatchCefPageAccessor::Document() {
  if (!entered_) {
    throw std::runtime_error("V8 context not entered");
  }
  CefRefPtr<CefV8Value> document = context_->GetGlobal()->GetValue("document");
  if (!document || !document->IsObject()) {
    throw std::runtime_error("document is not available");
  }
  return document;
}

CefRefPtr<CefV8Value> SwatchCefPageAccessor::Element(ElementHandle element) {
  if (element < 0 || element >= static_cast<ElementHandle>(elements_.size())) {
    throw std::runtime_error("Unknown element handle " + std::to_string(element));
  }
  return elements_[element];
}

ElementHandle SwatchCefPageAccessor::Intern(CefRefPtr<CefV8Value> value) {
  if (!value || !value->IsObject()) {
    return kNoElement;
  }
  for (size_t i = 0; i < elements_.size(); i++) {
    if (elements_[i]->IsSame(value)) {
      return static_cast<ElementHandle>(i);
    }
  }
  elements_.push_back(value);
  return static_cast<ElementHandle>(elements_.size() - 1);
}

CefRefPtr<CefV8Value> SwatchCefPageAccessor::Get(CefRefPtr<CefV8Value> object, const std::string& name) {
  if (!object || !object->IsObject()) {
    throw std::runtime_error("Cannot read '" + name + "' of a non-object");
  }
  CefRefPtr<CefV8Value> value = object->GetValue(name);
  if (object->HasException()) {
    std::string message = object->GetException()->GetMessage().ToString();
    object->ClearException();
    throw std::runtime_error(message);
  }
  return value;
}

CefRefPtr<CefV8Value> SwatchCefPageAccessor::Get(CefRefPtr<CefV8Value> object, int index) {
  if (!object || !object->IsObject()) {
    throw std::runtime_error("Cannot index a non-object");
  }
  CefRefPtr<CefV8Value> value = object->GetValue(index);
  if (object->HasException()) {
    std::string message = object->GetException()->GetMessage().ToString();
    object->ClearException();
    throw std::runtime_error(message);
  }
  return value;
}

CefRefPtr<CefV8Value> SwatchCefPageAccessor::Call(CefRefPtr<CefV8Value> object, const std::string& method,
                                                  const CefV8ValueList& args) {
  CefRefPtr<CefV8Value> function = Get(object, method);
  if (!function || !function->IsFunction()) {
    throw std::runtime_error(method + " is not a function");
  }
  CefRefPtr<CefV8Value> result = function->ExecuteFunctionWithContext(context_, object, args);
  if (function->HasException()) {
    std::string message = function->GetException()->GetMessage().ToString();
    function->ClearException();
    throw std::runtime_error(method + ": " + message);
  }
  return result;
}

CefRefPtr<CefV8Value> SwatchCefPageAccessor::Call(CefRefPtr<CefV8Value> object, const std::string& method,
                                                  const std::string& arg) {
  CefV8ValueList args;
  args.push_back(CefV8Value::CreateString(arg));
  return Call(object, method, args);
}

int SwatchCefPageAccessor::Length(CefRefPtr<CefV8Value> list) {
  if (!list || !list->IsObject()) {
    return 0;
  }
  CefRefPtr<CefV8Value> length = Get(list, "length");
  return (length && length->IsInt()) ? length->GetIntValue() : 0;
}

std::string SwatchCefPageAccessor::AsString(CefRefPtr<CefV8Value> value) {
  if (!value || !value->IsString()) {
    return "";
  }
  return value->GetStringValue().ToString();
}

double SwatchCefPageAccessor::AsNumber(CefRefPtr<CefV8Value> value) {
  if (!value) {
    return 0.0;
  }
  if (value->IsDouble() || value->IsInt() || value->IsUInt()) {
    return value->GetDoubleValue();
  }
  return 0.0;
}

// ============================================================================
// Stylesheets
// ============================================================================

int SwatchCefPageAccessor::GetStyleSheetCount() {
  return Length(Get(Document(), "styleSheets"));
}

StyleSheetInfo SwatchCefPageAccessor::ReadStyleSheet(int index) {
  StyleSheetInfo info;
  CefRefPtr<CefV8Value> sheet = Get(Get(Document(), "styleSheets"), index);
  if (!sheet || !sheet->IsObject()) {
    info.error = "stylesheet missing";
    return info;
  }
  info.href = AsString(Get(sheet, "href"));

  // Cross-origin sheets throw a SecurityError from the cssRules getter
  CefRefPtr<CefV8Value> rules;
  try {
    rules = Get(sheet, "cssRules");
  } catch (const std::runtime_error& e) {
    info.error = e.what();
    return info;
  }
  if (!rules || !rules->IsObject()) {
    info.error = "cssRules not accessible";
    return info;
  }

  info.accessible = true;
  int count = Length(rules);
  for (int i = 0; i < count; i++) {
    try {
      info.rules.push_back(ReadRule(Get(rules, i)));
    } catch (const std::runtime_error& e) {
      CssRuleInfo failed;
      failed.error = e.what();
      info.rules.push_back(failed);
    }
  }
  return info;
}

CssRuleInfo SwatchCefPageAccessor::ReadRule(CefRefPtr<CefV8Value> rule) {
  CssRuleInfo info;
  int type = static_cast<int>(AsNumber(Get(rule, "type")));
  if (type == kStyleRule) {
    info.type = CssRuleType::STYLE;
  } else if (type == kFontFaceRule) {
    info.type = CssRuleType::FONT_FACE;
  } else {
    return info;
  }

  CefRefPtr<CefV8Value> style = Get(rule, "style");
  int count = Length(style);
  for (int i = 0; i < count; i++) {
    std::string name = AsString(Get(style, i));
    if (name.empty()) {
      continue;
    }
    info.declarations.emplace_back(name, AsString(Call(style, "getPropertyValue", name)));
  }
  return info;
}

// ============================================================================
// Document structure
// ============================================================================

ElementHandle SwatchCefPageAccessor::GetDocumentElement() {
  return Intern(Get(Document(), "documentElement"));
}

ElementHandle SwatchCefPageAccessor::GetBody() {
  return Intern(Get(Document(), "body"));
}

std::vector<ElementHandle> SwatchCefPageAccessor::QuerySelectorAll(const std::string& selector) {
  std::vector<ElementHandle> handles;
  CefRefPtr<CefV8Value> list = Call(Document(), "querySelectorAll", selector);
  int count = Length(list);
  for (int i = 0; i < count; i++) {
    ElementHandle handle = Intern(Get(list, i));
    if (handle != kNoElement) {
      handles.push_back(handle);
    }
  }
  return handles;
}

bool SwatchCefPageAccessor::Matches(ElementHandle element, const std::string& selector) {
  CefRefPtr<CefV8Value> result = Call(Element(element), "matches", selector);
  return result && result->IsBool() && result->GetBoolValue();
}

ElementHandle SwatchCefPageAccessor::Closest(ElementHandle element, const std::string& selector) {
  return Intern(Call(Element(element), "closest", selector));
}

std::vector<ChildNode> SwatchCefPageAccessor::GetChildNodes(ElementHandle element) {
  std::vector<ChildNode> children;
  CefRefPtr<CefV8Value> nodes = Get(Element(element), "childNodes");
  int count = Length(nodes);
  for (int i = 0; i < count; i++) {
    CefRefPtr<CefV8Value> node = Get(nodes, i);
    int node_type = static_cast<int>(AsNumber(Get(node, "nodeType")));
    ChildNode child;
    if (node_type == 1) {
      child.element = Intern(node);
      children.push_back(child);
    } else if (node_type == 3 || node_type == 4) {
      child.text = AsString(Get(node, "nodeValue"));
      children.push_back(child);
    }
  }
  return children;
}

// ============================================================================
// Element data
// ============================================================================

std::string SwatchCefPageAccessor::GetTagName(ElementHandle element) {
  return AsString(Get(Element(element), "tagName"));
}

std::string SwatchCefPageAccessor::GetClassName(ElementHandle element) {
  CefRefPtr<CefV8Value> class_name = Get(Element(element), "className");
  if (class_name && class_name->IsObject()) {
    // SVGAnimatedString
    return AsString(Get(class_name, "baseVal"));
  }
  return AsString(class_name);
}

std::string SwatchCefPageAccessor::GetTextContent(ElementHandle element) {
  return AsString(Get(Element(element), "textContent"));
}

bool SwatchCefPageAccessor::HasAttribute(ElementHandle element, const std::string& name) {
  CefRefPtr<CefV8Value> result = Call(Element(element), "hasAttribute", name);
  return result && result->IsBool() && result->GetBoolValue();
}

std::string SwatchCefPageAccessor::GetAttribute(ElementHandle element, const std::string& name) {
  return AsString(Call(Element(element), "getAttribute", name));
}

std::vector<std::pair<std::string, std::string>> SwatchCefPageAccessor::GetAttributes(ElementHandle element) {
  std::vector<std::pair<std::string, std::string>> attributes;
  CefRefPtr<CefV8Value> map = Get(Element(element), "attributes");
  int count = Length(map);
  for (int i = 0; i < count; i++) {
    CefRefPtr<CefV8Value> attr = Get(map, i);
    attributes.emplace_back(AsString(Get(attr, "name")), AsString(Get(attr, "value")));
  }
  return attributes;
}

std::string SwatchCefPageAccessor::GetProperty(ElementHandle element, const std::string& name) {
  return AsString(Get(Element(element), name));
}

ElementRect SwatchCefPageAccessor::GetBoundingClientRect(ElementHandle element) {
  CefRefPtr<CefV8Value> rect = Call(Element(element), "getBoundingClientRect", CefV8ValueList());
  ElementRect out;
  if (rect && rect->IsObject()) {
    out.x = AsNumber(Get(rect, "left"));
    out.y = AsNumber(Get(rect, "top"));
    out.width = AsNumber(Get(rect, "width"));
    out.height = AsNumber(Get(rect, "height"));
  }
  return out;
}

// ============================================================================
// Styles
// ============================================================================

std::string SwatchCefPageAccessor::GetComputedStyle(ElementHandle element, const std::string& property) {
  CefV8ValueList args;
  args.push_back(Element(element));
  CefRefPtr<CefV8Value> style = Call(context_->GetGlobal(), "getComputedStyle", args);
  if (!style || !style->IsObject()) {
    return "";
  }
  return AsString(Call(style, "getPropertyValue", property));
}

std::string SwatchCefPageAccessor::GetInlineStyle(ElementHandle element, const std::string& property) {
  CefRefPtr<CefV8Value> style = Get(Element(element), "style");
  if (!style || !style->IsObject()) {
    return "";
  }
  return AsString(Call(style, "getPropertyValue", property));
}

std::string SwatchCefPageAccessor::ResolveColor(const std::string& css_color) {
  if (!entered_) {
    throw std::runtime_error("V8 context not entered");
  }
  if (!color_resolver_) {
    CefRefPtr<CefV8Value> retval;
    CefRefPtr<CefV8Exception> exception;
    if (!context_->Eval(kColorResolverScript, "", 0, retval, exception) || !retval || !retval->IsFunction()) {
      throw std::runtime_error("Canvas colour resolver unavailable");
    }
    color_resolver_ = retval;
  }

  CefV8ValueList args;
  args.push_back(CefV8Value::CreateString(css_color));
  CefRefPtr<CefV8Value> result = color_resolver_->ExecuteFunctionWithContext(context_, nullptr, args);
  if (color_resolver_->HasException()) {
    std::string message = color_resolver_->GetException()->GetMessage().ToString();
    color_resolver_->ClearException();
    throw std::runtime_error(message);
  }
  return AsString(result);
}
