#include "notify/TemplateEngine.hpp"

#include <gtest/gtest.h>

#include "common/Errors.hpp"

using certmon::common::AlertSettings;
using certmon::common::TemplateError;
using namespace certmon::notify;

TEST(TemplateEngineTest, RendersKnownFields) {
  OperationTemplateData otd;
  otd.sAction = "ADD";
  otd.sDomain = "a.example.com";
  otd.sDetails = "Target: 192.0.2.1";
  otd.sTime = "2026-03-10 12:00:00";

  const auto sOut = TemplateEngine::render("{{.Action}} {{ .Domain }}\n{{.Details}} @ {{.Time}}",
                                           TemplateCategory::Operation, otd.toValues());

  EXPECT_EQ(sOut, "ADD a.example.com\nTarget: 192.0.2.1 @ 2026-03-10 12:00:00");
}

TEST(TemplateEngineTest, NumericFieldsRenderAsIntegers) {
  ExpiryTemplateData etd;
  etd.sDomain = "a.example.com";
  etd.iDays = 7;
  etd.iHttpCode = 200;

  EXPECT_EQ(TemplateEngine::render("{{.Domain}}: {{.Days}}d ({{.HTTPCode}})",
                                   TemplateCategory::Expiry, etd.toValues()),
            "a.example.com: 7d (200)");
}

TEST(TemplateEngineTest, UnknownFieldThrows) {
  try {
    TemplateEngine::render("{{.Days}}", TemplateCategory::Operation, {});
    FAIL() << "expected TemplateError";
  } catch (const TemplateError& e) {
    EXPECT_EQ(e._sErrorCode, "unknown_field");
    EXPECT_EQ(e._iHttpStatus, 422);
  }
}

TEST(TemplateEngineTest, MalformedPlaceholdersThrow) {
  EXPECT_THROW(TemplateEngine::validate("{{.Domain", TemplateCategory::Operation), TemplateError);
  EXPECT_THROW(TemplateEngine::validate("{{Domain}}", TemplateCategory::Operation), TemplateError);
  EXPECT_THROW(TemplateEngine::validate("{{.}}", TemplateCategory::Operation), TemplateError);
  EXPECT_THROW(TemplateEngine::validate("{{.Do main}}", TemplateCategory::Operation),
               TemplateError);
}

TEST(TemplateEngineTest, PlainTextPassesThrough) {
  EXPECT_EQ(TemplateEngine::render("no fields } here {", TemplateCategory::TaskSummary, {}),
            "no fields } here {");
  EXPECT_NO_THROW(TemplateEngine::validate("", TemplateCategory::Expiry));
}

TEST(TemplateEngineTest, ReferencesFindsField) {
  EXPECT_TRUE(TemplateEngine::references("Hi {{ .Reason }}", "Reason"));
  EXPECT_FALSE(TemplateEngine::references("Hi {{.Domain}}", "Reason"));
  EXPECT_FALSE(TemplateEngine::references("broken {{.Reason", "Reason"));
}

TEST(TemplateEngineTest, TaskSummaryFields) {
  TaskSummaryData tsd;
  tsd.iAdded = 3;
  tsd.iDeleted = 1;
  tsd.sDuration = "2.5s";

  EXPECT_EQ(TemplateEngine::render("+{{.Added}} -{{.Deleted}} in {{.Duration}}",
                                   TemplateCategory::TaskSummary, tsd.toValues()),
            "+3 -1 in 2.5s");
}

TEST(TemplateEngineTest, ValidateTemplatesNamesOffendingSetting) {
  AlertSettings als;
  als.sAddTemplate = "{{.Domain}}";
  als.sSyncFinishTemplate = "{{.Domain}}";

  try {
    validateTemplates(als);
    FAIL() << "expected TemplateError";
  } catch (const TemplateError& e) {
    EXPECT_NE(std::string(e.what()).find("sync_finish_tpl"), std::string::npos);
  }
}

TEST(TemplateEngineTest, ValidateTemplatesAcceptsDefaults) {
  EXPECT_NO_THROW(validateTemplates(AlertSettings{}));
}
