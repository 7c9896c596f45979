/** \file   TemplateLoaderTest.cc
 *  \brief  Test cases for template lookup, caching and XInclude processing.
 *
 *  \copyright 2024 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#define BOOST_TEST_MODULE TemplateLoader
#define BOOST_TEST_DYN_LINK

#include <sys/stat.h>
#include <sys/time.h>
#include <boost/test/unit_test.hpp>
#include "FileUtil.h"
#include "IniFile.h"
#include "MarkupTemplate.h"
#include "TemplateError.h"
#include "TemplateLoader.h"


namespace {


void WriteTemplate(const std::string &path, const std::string &contents, const time_t modification_time) {
    BOOST_REQUIRE(FileUtil::WriteString(path, contents));
    const struct timeval times[2]{ { modification_time, 0 }, { modification_time, 0 } };
    BOOST_REQUIRE_EQUAL(::utimes(path.c_str(), times), 0);
}


std::string Render(const std::shared_ptr<const Markup::Template> &markup_template,
                   const Markup::Context::Frame &variables = Markup::Context::Frame())
{
    Markup::Context context(variables);
    return markup_template->render(&context);
}


} // unnamed namespace


BOOST_AUTO_TEST_CASE(LoadedTemplatesAreCached) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/TemplateLoaderTest");
    const std::string &dir(temp_dir.getDirectoryPath());
    WriteTemplate(dir + "/page.html", "<p>$greeting</p>", 1000000000);

    Markup::TemplateLoader loader(std::vector<std::string>{ dir });
    const auto page(loader.load("page.html"));
    BOOST_CHECK_EQUAL(page->getFilename(), dir + "/page.html");
    BOOST_CHECK(loader.load("page.html") == page);
    BOOST_CHECK(loader.load(dir + "/page.html") == page);
    BOOST_CHECK_EQUAL(loader.size(), 1u);
    BOOST_CHECK_EQUAL(Render(page, { { "greeting", Markup::Value("Hi") } }), "<p>Hi</p>");
}


BOOST_AUTO_TEST_CASE(ModifiedTemplatesAreReloaded) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/TemplateLoaderTest");
    const std::string &dir(temp_dir.getDirectoryPath());
    WriteTemplate(dir + "/page.html", "<p>old</p>", 1000000000);

    Markup::TemplateLoader reloading_loader(std::vector<std::string>{ dir });
    Markup::TemplateLoader caching_loader(std::vector<std::string>{ dir }, /* auto_reload = */ false);
    const auto old_page(reloading_loader.load("page.html"));
    const auto cached_page(caching_loader.load("page.html"));

    WriteTemplate(dir + "/page.html", "<p>new</p>", 1000000100);
    const auto new_page(reloading_loader.load("page.html"));
    BOOST_CHECK(new_page != old_page);
    BOOST_CHECK_EQUAL(Render(new_page), "<p>new</p>");
    BOOST_CHECK_EQUAL(Render(old_page), "<p>old</p>");
    BOOST_CHECK_EQUAL(reloading_loader.size(), 1u);

    BOOST_CHECK(caching_loader.load("page.html") == cached_page);
    BOOST_CHECK_EQUAL(Render(cached_page), "<p>old</p>");
}


BOOST_AUTO_TEST_CASE(MissingTemplates) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/TemplateLoaderTest");
    const std::string &dir(temp_dir.getDirectoryPath());

    Markup::TemplateLoader loader(std::vector<std::string>{ dir, dir + "/other" });
    try {
        loader.load("nonexistent.html");
        BOOST_FAIL("expected a TemplateNotFound");
    } catch (const Markup::TemplateNotFound &x) {
        BOOST_CHECK_EQUAL(x.getName(), "nonexistent.html");
        BOOST_REQUIRE_EQUAL(x.getSearchPath().size(), 2u);
        BOOST_CHECK_EQUAL(x.getSearchPath()[0], dir);
        BOOST_CHECK_EQUAL(x.getSearchPath()[1], dir + "/other");
    }
    BOOST_CHECK_EQUAL(loader.size(), 0u);
}


BOOST_AUTO_TEST_CASE(SearchPathOrder) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/TemplateLoaderTest");
    const std::string &dir(temp_dir.getDirectoryPath());
    BOOST_REQUIRE_EQUAL(::mkdir((dir + "/first").c_str(), 0755), 0);
    BOOST_REQUIRE_EQUAL(::mkdir((dir + "/second").c_str(), 0755), 0);
    WriteTemplate(dir + "/first/a.html", "<p>first</p>", 1000000000);
    WriteTemplate(dir + "/second/a.html", "<p>second</p>", 1000000000);
    WriteTemplate(dir + "/second/b.html", "<p>only second</p>", 1000000000);

    Markup::TemplateLoader loader(std::vector<std::string>{ dir + "/first", dir + "/second/" });
    BOOST_CHECK_EQUAL(Render(loader.load("a.html")), "<p>first</p>");
    BOOST_CHECK_EQUAL(Render(loader.load("b.html")), "<p>only second</p>");
}


BOOST_AUTO_TEST_CASE(IncludesAreResolvedRelativeToTheIncludingTemplate) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/TemplateLoaderTest");
    const std::string &dir(temp_dir.getDirectoryPath());
    BOOST_REQUIRE_EQUAL(::mkdir((dir + "/sub").c_str(), 0755), 0);
    WriteTemplate(dir + "/sub/main.html",
                  "<html xmlns:xi=\"http://www.w3.org/2001/XInclude\">\n"
                  "  <xi:include href=\"header.html\"/>\n"
                  "</html>",
                  1000000000);
    WriteTemplate(dir + "/sub/header.html", "<div>$title</div>", 1000000000);

    Markup::TemplateLoader loader(std::vector<std::string>{ dir });
    const auto main_template(loader.load("sub/main.html"));
    BOOST_CHECK_EQUAL(Render(main_template, { { "title", Markup::Value("Hi") } }), "<html>\n  <div>Hi</div>\n</html>");
    BOOST_CHECK_EQUAL(loader.size(), 2u);
}


BOOST_AUTO_TEST_CASE(IncludedMatchTemplatesApplyToTheIncludingTemplate) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/TemplateLoaderTest");
    const std::string &dir(temp_dir.getDirectoryPath());
    WriteTemplate(dir + "/layout.html",
                  "<div xmlns:py=\"http://purl.org/kid/ns#\" py:strip=\"\">"
                  "<em py:match=\"greeting\">Hello ${select('@name')}</em>"
                  "</div>",
                  1000000000);
    WriteTemplate(dir + "/page.html",
                  "<p xmlns:xi=\"http://www.w3.org/2001/XInclude\"><xi:include href=\"layout.html\"/><greeting name=\"Dude\"/></p>",
                  1000000000);

    Markup::TemplateLoader loader(std::vector<std::string>{ dir });
    BOOST_CHECK_EQUAL(Render(loader.load("page.html")), "<p><em>Hello Dude</em></p>");
}


BOOST_AUTO_TEST_CASE(IncludeFallbacks) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/TemplateLoaderTest");
    const std::string &dir(temp_dir.getDirectoryPath());
    WriteTemplate(dir + "/with_fallback.html",
                  "<div xmlns:xi=\"http://www.w3.org/2001/XInclude\">"
                  "<xi:include href=\"missing.html\"><xi:fallback><p>$what</p></xi:fallback></xi:include>"
                  "</div>",
                  1000000000);
    WriteTemplate(dir + "/without_fallback.html",
                  "<div xmlns:xi=\"http://www.w3.org/2001/XInclude\"><xi:include href=\"missing.html\"/></div>", 1000000000);
    WriteTemplate(dir + "/without_href.html", "<div xmlns:xi=\"http://www.w3.org/2001/XInclude\"><xi:include/></div>", 1000000000);

    Markup::TemplateLoader loader(std::vector<std::string>{ dir });
    BOOST_CHECK_EQUAL(Render(loader.load("with_fallback.html"), { { "what", Markup::Value("none") } }), "<div><p>none</p></div>");
    BOOST_CHECK_THROW(Render(loader.load("without_fallback.html")), Markup::TemplateNotFound);
    BOOST_CHECK_THROW(Render(loader.load("without_href.html")), Markup::TemplateError);
}


BOOST_AUTO_TEST_CASE(IncludesAfterTheLoaderIsGone) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/TemplateLoaderTest");
    const std::string &dir(temp_dir.getDirectoryPath());
    WriteTemplate(dir + "/a.html", "<div xmlns:xi=\"http://www.w3.org/2001/XInclude\"><xi:include href=\"b.html\"/></div>",
                  1000000000);
    WriteTemplate(dir + "/b.html", "<p>b</p>", 1000000000);
    WriteTemplate(dir + "/plain.html", "<p>plain</p>", 1000000000);

    std::shared_ptr<const Markup::Template> including_template, plain_template;
    {
        Markup::TemplateLoader loader(std::vector<std::string>{ dir });
        including_template = loader.load("a.html");
        plain_template = loader.load("plain.html");
        BOOST_CHECK_EQUAL(Render(including_template), "<div><p>b</p></div>");
    }

    BOOST_CHECK_THROW(Render(including_template), Markup::TemplateError);
    BOOST_CHECK_EQUAL(Render(plain_template), "<p>plain</p>");
}


BOOST_AUTO_TEST_CASE(ConfigurationFromAnIniFile) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/TemplateLoaderTest");
    const std::string &dir(temp_dir.getDirectoryPath());
    BOOST_REQUIRE(FileUtil::WriteString(dir + "/loader.conf", "[Loader]\n"
                                                              "search_path = \"" + dir + "/a:" + dir + "/b\"\n"
                                                              "auto_reload = false\n"));

    const IniFile ini_file(dir + "/loader.conf");
    const Markup::TemplateLoader loader(ini_file);
    BOOST_REQUIRE_EQUAL(loader.getSearchPath().size(), 2u);
    BOOST_CHECK_EQUAL(loader.getSearchPath()[0], dir + "/a");
    BOOST_CHECK_EQUAL(loader.getSearchPath()[1], dir + "/b");
    BOOST_CHECK(not loader.getAutoReload());

    const Markup::TemplateLoader default_loader(ini_file, "Missing");
    BOOST_CHECK(default_loader.getSearchPath().empty());
    BOOST_CHECK(default_loader.getAutoReload());
}
