/** \file   TemplateLoader.h
 *  \brief  Loads markup templates from the file system and caches them.
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
#pragma once


#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "MarkupTemplate.h"


class IniFile;


namespace Markup {


/** \class TemplateLoader
 *  \brief Resolves template names against a search path and caches the compiled templates.
 *
 *  Every loaded template gets an IncludeFilter that resolves its "xi:include" elements through this loader, relative to
 *  the including template.  Those filters only keep a weak reference to the loader: once the loader has been destroyed,
 *  rendering a template that contains an "xi:include" element throws a TemplateError.
 */
class TemplateLoader {
    struct CacheEntry {
        std::shared_ptr<const Template> template_;
        timespec last_modification_time_;
    };

    std::vector<std::string> search_path_;
    bool auto_reload_;
    mutable std::mutex cache_mutex_;
    std::unordered_map<std::string, CacheEntry> canonical_paths_to_cache_entries_;
    std::shared_ptr<TemplateLoader *> self_; // Expires with the loader, see getHandle().

public:
    explicit TemplateLoader(const std::vector<std::string> &search_path, const bool auto_reload = true)
        : search_path_(search_path), auto_reload_(auto_reload), self_(std::make_shared<TemplateLoader *>(this)) { }

    /** \brief Reads "search_path", a colon-separated list of directories, and "auto_reload" from "section_name". */
    explicit TemplateLoader(const IniFile &ini_file, const std::string &section_name = "Loader");

    TemplateLoader(const TemplateLoader &rhs) = delete;
    TemplateLoader &operator=(const TemplateLoader &rhs) = delete;

    inline const std::vector<std::string> &getSearchPath() const { return search_path_; }
    inline bool getAutoReload() const { return auto_reload_; }

    /** \brief Returns the cached template for "name" or loads and compiles it.
     *  \param name         An absolute path or a path relative to the directory of "relative_to" or to one of the
     *                      directories of the search path, tried in that order.
     *  \param relative_to  The file name of the template that refers to "name", if any.
     *  \throws TemplateNotFound if no candidate is a readable file, TemplateSyntaxError if the template is malformed.
     *  \note  With auto-reloading enabled a cached template is recompiled if its file has been modified since it was
     *         loaded.
     */
    std::shared_ptr<const Template> load(const std::string &name, const std::string &relative_to = "");

    /** \return The number of cached templates. */
    size_t size() const;

    /** \return A reference to this loader that expires when the loader is destroyed. */
    inline std::weak_ptr<TemplateLoader *> getHandle() const { return self_; }

private:
    std::vector<std::string> getCandidatePaths(const std::string &name, const std::string &relative_to) const;
    std::shared_ptr<const Template> compile(const std::string &path);
};


} // namespace Markup
