// tests/options_tests.cpp
// -----------------------------------------------------------------------------
// conversion_options: defaults, lenient enumerations, validated scalars.
// -----------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "prince/errors.hpp"
#include "prince/options.hpp"

using prince::configuration_error;
using prince::conversion_options;

TEST(ConversionOptions, Defaults)
{
    conversion_options o("/usr/bin/prince");
    EXPECT_EQ("/usr/bin/prince", o.exe_path());
    EXPECT_EQ("auto", o.input_type());
    EXPECT_EQ("auto", o.raster_format());
    EXPECT_EQ(-1, o.raster_jpeg_quality());
    EXPECT_EQ(-1, o.raster_threads());
    EXPECT_EQ(0, o.raster_page());
    EXPECT_TRUE(o.embed_fonts());
    EXPECT_TRUE(o.subset_fonts());
    EXPECT_TRUE(o.system_fonts());
    EXPECT_TRUE(o.compress());
    EXPECT_FALSE(o.encrypt());
    EXPECT_FALSE(o.has_encrypt_info());
    EXPECT_TRUE(o.style_sheets().empty());
    EXPECT_TRUE(o.extra_options().empty());
}

// -----------------------------------------------------------------------------
// Enumerations fall back silently
// -----------------------------------------------------------------------------
TEST(ConversionOptions, UnknownInputTypeFallsBackToAuto)
{
    conversion_options o("prince");
    o.set_input_type("html");
    EXPECT_EQ("html", o.input_type());
    EXPECT_NO_THROW(o.set_input_type("foo"));
    EXPECT_EQ("auto", o.input_type());
}

TEST(ConversionOptions, EnumerationsAreCaseInsensitive)
{
    conversion_options o("prince");
    o.set_input_type("XML");
    EXPECT_EQ("xml", o.input_type());
    o.set_raster_format("PNG");
    EXPECT_EQ("png", o.raster_format());
    o.set_pdf_profile("PDF/A-3B");
    EXPECT_EQ("pdf/a-3b", o.pdf_profile());
}

TEST(ConversionOptions, OtherEnumerationFallbacks)
{
    conversion_options o("prince");
    o.set_auth_scheme("ftp");
    EXPECT_EQ("", o.auth_scheme());
    o.set_ssl_cert_type("p12");
    EXPECT_EQ("", o.ssl_cert_type());
    o.set_ssl_version("sslv3");
    EXPECT_EQ("", o.ssl_version());
    o.set_ssl_version("tlsv1.3");
    EXPECT_EQ("tlsv1.3", o.ssl_version());
    o.set_pdf_profile("pdf/z");
    EXPECT_EQ("", o.pdf_profile());
    o.set_raster_format("gif");
    EXPECT_EQ("auto", o.raster_format());
    o.set_raster_background("blue");
    EXPECT_EQ("", o.raster_background());
}

TEST(ConversionOptions, SetHtmlMapsToInputType)
{
    conversion_options o("prince");
    o.set_html(true);
    EXPECT_EQ("html", o.input_type());
    o.set_html(false);
    EXPECT_EQ("xml", o.input_type());
}

TEST(ConversionOptions, AuthMethods)
{
    conversion_options o("prince");
    o.add_auth_method("Basic");
    o.add_auth_method("kerberos");
    o.add_auth_method("digest");
    ASSERT_EQ(2u, o.auth_methods().size());
    EXPECT_EQ("basic", o.auth_methods()[0]);
    EXPECT_EQ("digest", o.auth_methods()[1]);

    o.set_auth_method("ntlm");
    ASSERT_EQ(1u, o.auth_methods().size());
    EXPECT_EQ("ntlm", o.auth_methods()[0]);

    o.set_auth_method("bogus");
    EXPECT_TRUE(o.auth_methods().empty());
}

// -----------------------------------------------------------------------------
// Validated scalars
// -----------------------------------------------------------------------------
TEST(ConversionOptions, OutOfRangeScalarsThrow)
{
    conversion_options o("prince");
    EXPECT_THROW(o.set_http_timeout(0), configuration_error);
    EXPECT_THROW(o.set_max_passes(0), configuration_error);
    EXPECT_THROW(o.set_css_dpi(-5), configuration_error);
    EXPECT_THROW(o.set_raster_jpeg_quality(101), configuration_error);
    EXPECT_THROW(o.set_raster_jpeg_quality(-1), configuration_error);
    EXPECT_THROW(o.set_raster_page(0), configuration_error);
    EXPECT_THROW(o.set_raster_dpi(0), configuration_error);

    // previous values untouched
    EXPECT_EQ(0, o.http_timeout());
    EXPECT_EQ(0, o.max_passes());
    EXPECT_EQ(-1, o.raster_jpeg_quality());
}

TEST(ConversionOptions, JpegQualityBoundsAccepted)
{
    conversion_options o("prince");
    o.set_raster_jpeg_quality(0);
    EXPECT_EQ(0, o.raster_jpeg_quality());
    o.set_raster_jpeg_quality(100);
    EXPECT_EQ(100, o.raster_jpeg_quality());
}

TEST(ConversionOptions, ConfigurationErrorIsInvalidArgument)
{
    conversion_options o("prince");
    EXPECT_THROW(o.set_http_timeout(-1), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// Encryption
// -----------------------------------------------------------------------------
TEST(ConversionOptions, EncryptInfoEnablesEncryption)
{
    conversion_options o("prince");
    o.set_encrypt_info(128, "user", "owner", true, false, true);
    EXPECT_TRUE(o.encrypt());
    ASSERT_TRUE(o.has_encrypt_info());
    EXPECT_EQ(128, o.encryption().key_bits);
    EXPECT_EQ("user", o.encryption().user_password);
    EXPECT_EQ("owner", o.encryption().owner_password);
    EXPECT_TRUE(o.encryption().disallow_print);
    EXPECT_FALSE(o.encryption().disallow_modify);
    EXPECT_TRUE(o.encryption().disallow_copy);
}

TEST(ConversionOptions, InvalidKeyBitsLeavesPriorSettings)
{
    conversion_options o("prince");
    o.set_encrypt_info(40, "u", "o", false, true);

    try {
        o.set_encrypt_info(64, "x", "y", true, true, true, true, true, true);
        FAIL() << "expected configuration_error";
    } catch (const configuration_error& ex) {
        EXPECT_NE(std::string::npos, std::string(ex.what()).find("64"));
    }

    EXPECT_TRUE(o.encrypt());
    EXPECT_EQ(40, o.encryption().key_bits);
    EXPECT_EQ("u", o.encryption().user_password);
    EXPECT_EQ("o", o.encryption().owner_password);
    EXPECT_FALSE(o.encryption().disallow_print);
    EXPECT_TRUE(o.encryption().disallow_modify);
}

TEST(ConversionOptions, InvalidKeyBitsDoesNotEnableEncryption)
{
    conversion_options o("prince");
    EXPECT_THROW(o.set_encrypt_info(256, "", ""), configuration_error);
    EXPECT_FALSE(o.encrypt());
    EXPECT_FALSE(o.has_encrypt_info());
}

// -----------------------------------------------------------------------------
// Repeatable fields
// -----------------------------------------------------------------------------
TEST(ConversionOptions, RepeatableFieldsKeepOrderAndDuplicates)
{
    conversion_options o("prince");
    o.add_style_sheet("a.css");
    o.add_style_sheet("b.css");
    o.add_style_sheet("a.css");
    ASSERT_EQ(3u, o.style_sheets().size());
    EXPECT_EQ("a.css", o.style_sheets()[0]);
    EXPECT_EQ("b.css", o.style_sheets()[1]);
    EXPECT_EQ("a.css", o.style_sheets()[2]);

    o.clear_style_sheets();
    EXPECT_TRUE(o.style_sheets().empty());
}

TEST(ConversionOptions, PdfEventScriptsKeyedByEvent)
{
    conversion_options o("prince");
    o.add_pdf_event_script("will-print", "a()");
    o.add_pdf_event_script("Did-Save", "b()");
    o.add_pdf_event_script("WILL-PRINT", "c()");

    ASSERT_EQ(2u, o.pdf_event_scripts().size());
    EXPECT_EQ("will-print", o.pdf_event_scripts()[0].first);
    EXPECT_EQ("c()", o.pdf_event_scripts()[0].second);
    EXPECT_EQ("did-save", o.pdf_event_scripts()[1].first);

    EXPECT_THROW(o.add_pdf_event_script("on-open", "x()"), configuration_error);
    EXPECT_EQ(2u, o.pdf_event_scripts().size());
}

TEST(ConversionOptions, GroupSetters)
{
    conversion_options o("prince");
    o.set_no_warn_css(true);
    EXPECT_TRUE(o.no_warn_css_unknown());
    EXPECT_TRUE(o.no_warn_css_unsupported());

    o.set_fail_safe(true);
    EXPECT_TRUE(o.fail_dropped_content());
    EXPECT_TRUE(o.fail_missing_resources());
    EXPECT_TRUE(o.fail_stripped_transparency());
    EXPECT_TRUE(o.fail_missing_glyphs());
    EXPECT_TRUE(o.fail_pdf_profile_error());
    EXPECT_TRUE(o.fail_pdf_tag_error());
    EXPECT_TRUE(o.fail_invalid_license());
    o.set_fail_safe(false);
    EXPECT_FALSE(o.fail_missing_glyphs());
}

TEST(ConversionOptions, FreeFormOptionsSplitOnWhitespace)
{
    conversion_options o("prince");
    o.set_options("  --foo   --bar=1\t--baz ");
    ASSERT_EQ(3u, o.extra_options().size());
    EXPECT_EQ("--foo", o.extra_options()[0]);
    EXPECT_EQ("--bar=1", o.extra_options()[1]);
    EXPECT_EQ("--baz", o.extra_options()[2]);

    o.set_options("");
    EXPECT_TRUE(o.extra_options().empty());
}
