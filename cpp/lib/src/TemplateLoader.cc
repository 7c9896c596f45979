/** \file   TemplateLoader.cc
 *  \brief  Implementation of the template loader.
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
#include "TemplateLoader.h"
#include "FileUtil.h"
#include "IniFile.h"
#include "StringUtil.h"
#include "TemplateError.h"
#include "util.h"


namespace Markup {


TemplateLoader::TemplateLoader(const IniFile &ini_file, const std::string &section_name)
    : self_(std::make_shared<TemplateLoader *>(this))
{
    StringUtil::Split(ini_file.getString(section_name, "search_path", ""), ':', &search_path_);
    auto_reload_ = ini_file.getBool(section_name, "auto_reload", true);
}


size_t TemplateLoader::size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return canonical_paths_to_cache_entries_.size();
}


std::vector<std::string> TemplateLoader::getCandidatePaths(const std::string &name, const std::string &relative_to) const {
    if (StringUtil::StartsWith(name, "/"))
        return { name };

    std::vector<std::string> candidate_paths;
    if (not relative_to.empty())
        candidate_paths.emplace_back(FileUtil::MakeAbsolutePath(relative_to, name));
    for (const auto &directory : search_path_)
        candidate_paths.emplace_back(StringUtil::EndsWith(directory, "/") ? directory + name : directory + "/" + name);

    return candidate_paths;
}


std::shared_ptr<const Template> TemplateLoader::compile(const std::string &path) {
    std::string source;
    if (unlikely(not FileUtil::ReadString(path, &source)))
        throw TemplateError("in Markup::TemplateLoader::compile: failed to read \"" + path + "\"!");

    const auto new_template(std::make_shared<Template>(source, path));
    new_template->addPreFilter(std::make_shared<IncludeFilter>(getHandle(), path));
    return new_template;
}


std::shared_ptr<const Template> TemplateLoader::load(const std::string &name, const std::string &relative_to) {
    for (const auto &candidate_path : getCandidatePaths(name, relative_to)) {
        if (not FileUtil::IsReadableFile(candidate_path))
            continue;

        const std::string canonical_path(FileUtil::MakeAbsolutePath(candidate_path));
        timespec last_modification_time;
        if (unlikely(not FileUtil::GetLastModificationTimestamp(canonical_path, &last_modification_time)))
            continue;

        std::lock_guard<std::mutex> lock(cache_mutex_);
        const auto path_and_cache_entry(canonical_paths_to_cache_entries_.find(canonical_path));
        if (path_and_cache_entry != canonical_paths_to_cache_entries_.end()) {
            const CacheEntry &cache_entry(path_and_cache_entry->second);
            if (not auto_reload_
                or (cache_entry.last_modification_time_.tv_sec == last_modification_time.tv_sec
                    and cache_entry.last_modification_time_.tv_nsec == last_modification_time.tv_nsec))
            {
                LOG_DEBUG("cache hit for \"" + canonical_path + "\"");
                return cache_entry.template_;
            }
            LOG_INFO("\"" + canonical_path + "\" has been modified, reloading it");
        } else
            LOG_DEBUG("cache miss for \"" + canonical_path + "\"");

        const std::shared_ptr<const Template> loaded_template(compile(canonical_path));
        canonical_paths_to_cache_entries_[canonical_path] = CacheEntry{ loaded_template, last_modification_time };
        return loaded_template;
    }

    std::vector<std::string> directories_tried(search_path_);
    if (not relative_to.empty() and not StringUtil::StartsWith(name, "/"))
        directories_tried.insert(directories_tried.begin(), FileUtil::GetDirname(relative_to));
    throw TemplateNotFound(name, directories_tried);
}


} // namespace Markup
