/** \file    expand_markup_template.cc
 *  \brief   Expands a markup template and prints the result to stdout.
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
#include <iostream>
#include <memory>
#include <vector>
#include <cstdlib>
#include <cstring>
#include "Context.h"
#include "IniFile.h"
#include "Main.h"
#include "MarkupTemplate.h"
#include "StringUtil.h"
#include "TemplateLoader.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config=ini_file] template_name [var1=value1 var2=value2 .. varN=valueN]\n"
            "Template names are resolved against the \"search_path\" of the [Loader] section of the config file or,\n"
            "if there is none, against the current working directory.  Entries of a [Variables] section seed the\n"
            "context.  For lists use semicolons to separate individual values.  If a value has an embedded semicolon\n"
            "use a backslash to escape it.  Also use a backslash to escape an embedded backslash.\n"
            "NB: Empty values are explicitly permitted!");
}


void ProcessNameValuePair(const std::string &name_value_pair, Markup::Context::Frame * const variables) {
    const auto first_equal_pos(name_value_pair.find('='));
    if (first_equal_pos == std::string::npos or first_equal_pos == 0)
        LOG_ERROR("bad name/value pair: \"" + name_value_pair + "\"!");
    const auto variable_name(name_value_pair.substr(0, first_equal_pos));

    Markup::Value::List list_values;
    std::string current_value;
    bool escaped(false);
    for (auto cp(name_value_pair.cbegin() + variable_name.length() + 1); cp != name_value_pair.cend(); ++cp) {
        if (escaped) {
            current_value += *cp;
            escaped = false;
        } else if (*cp == '\\')
            escaped = true;
        else if (*cp == ';') {
            list_values.emplace_back(current_value);
            current_value.clear();
        } else
            current_value += *cp;
    }
    if (escaped)
        LOG_ERROR("name/value pair w/ trailing escape: \"" + name_value_pair + "\"!");
    list_values.emplace_back(current_value);

    if (list_values.size() == 1)
        (*variables)[variable_name] = list_values.front();
    else
        (*variables)[variable_name] = Markup::Value(list_values);
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 2)
        Usage();

    std::unique_ptr<IniFile> ini_file;
    if (StringUtil::StartsWith(argv[1], "--config=")) {
        ini_file.reset(new IniFile(argv[1] + std::strlen("--config=")));
        --argc, ++argv;
        if (argc < 2)
            Usage();
    }

    std::unique_ptr<Markup::TemplateLoader> loader;
    if (ini_file != nullptr and not ini_file->getString("Loader", "search_path", "").empty())
        loader.reset(new Markup::TemplateLoader(*ini_file));
    else
        loader.reset(new Markup::TemplateLoader(std::vector<std::string>{ "." },
                                                ini_file == nullptr or ini_file->getBool("Loader", "auto_reload", true)));

    Markup::Context::Frame variables;
    if (ini_file != nullptr) {
        for (const auto &variable_name : ini_file->getSectionEntryNames("Variables"))
            variables[variable_name] = Markup::Value(ini_file->getString("Variables", variable_name));
    }
    for (int arg_no(2); arg_no < argc; ++arg_no)
        ProcessNameValuePair(argv[arg_no], &variables);

    const std::shared_ptr<const Markup::Template> markup_template(loader->load(argv[1]));
    LOG_DEBUG("expanding \"" + markup_template->getFilename() + "\" with " + std::to_string(variables.size()) + " variable(s)");

    Markup::Context context(variables);
    std::cout << markup_template->render(&context);

    return EXIT_SUCCESS;
}
