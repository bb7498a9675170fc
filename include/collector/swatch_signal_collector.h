#pragma once

#include "collector/swatch_page_accessor.h"
#include "core/swatch_branding_types.h"
#include <set>
#include <string>
#include <vector>

/**
 * SwatchSignalCollector - gathers a bounded sample of visual signals from a
 * rendered page into a RawBrandingRecord.
 *
 * The collector never mutates the page and only reads computed values.
 * Every stylesheet, rule and sampled element is read independently; a
 * failure on one item is recorded in css_data.skipped and collection goes on.
 */
class SwatchSignalCollector {
public:
  // Sampling queries, in sampling order
  static const char* const kLogoImageSelector;
  static const char* const kButtonSelector;
  static const char* const kFormControlSelector;
  static const char* const kTextSelector;

  static constexpr int kMaxLogoImages = 5;
  static constexpr int kMaxButtons = 50;
  static constexpr int kMaxFormControls = 25;
  static constexpr int kMaxTextElements = 50;
  static constexpr int kMaxLogoCandidates = 10;
  static constexpr size_t kMaxSnapshotText = 100;

  // Logo lookup
  static const char* const kHeaderLinkLogoSelector;
  static const char* const kHeaderRegionSelector;
  static const char* const kLogoContainerSelector;
  static const char* const kLogoExclusionSelector;

  // Run the whole collection pass
  static RawBrandingRecord Collect(SwatchPageAccessor& page);

  // Individual passes, exposed for tests
  static CssData CollectCssData(SwatchPageAccessor& page, double root_font_px, double body_font_px);
  static std::vector<ElementHandle> SampleElements(SwatchPageAccessor& page);
  static StyleSnapshot TakeSnapshot(SwatchPageAccessor& page, ElementHandle element,
                                    double root_font_px, double body_font_px);
  static void FindImages(SwatchPageAccessor& page, std::vector<BrandImage>& images,
                         std::vector<LogoCandidate>& logo_candidates);
  static void DetectColorScheme(SwatchPageAccessor& page, RawBrandingRecord& record);
  static RawTypography CollectTypography(SwatchPageAccessor& page);
  static std::set<std::string> DetectFrameworkHints(SwatchPageAccessor& page);
  static std::string FindBrandName(SwatchPageAccessor& page);

  // Hexify with the page's canvas round trip as the last resort
  static std::string HexifyWithPage(SwatchPageAccessor& page, const std::string& css_color);

private:
  static void ProcessStyleRule(SwatchPageAccessor& page, const CssRuleInfo& rule,
                               double root_font_px, double body_font_px, CssData& data,
                               std::set<std::string>& seen_colors);
  static void ProcessFontFaceRule(const CssRuleInfo& rule, CssData& data);

  static bool IsLogoImage(SwatchPageAccessor& page, ElementHandle img);
  static bool IsLogoSvg(SwatchPageAccessor& page, ElementHandle svg);
  // Header containment first, then the top-most element
  static ElementHandle PickBestLogo(SwatchPageAccessor& page, const std::vector<ElementHandle>& candidates);
  static LogoCandidate DescribeLogo(SwatchPageAccessor& page, ElementHandle element, const std::string& source);

  static bool HasExplicitDarkSignal(SwatchPageAccessor& page, ElementHandle element);
  static bool HasCtaIndicator(SwatchPageAccessor& page, ElementHandle element, const std::string& classes);
  static double FontSizePx(SwatchPageAccessor& page, ElementHandle element);
};
