/*
 *  This file is part of TagWriter.
 *
 *  Copyright (c) 2026 The TagWriter developers
 *
 *  TagWriter is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  TagWriter is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with TagWriter.  If not, see <https://www.gnu.org/licenses/>.
 */
#include "metadatamanager.h"

#include <iostream>

#include <glibmm/datetime.h>
#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>
#include <nlohmann/json.hpp>

#include "resultinterpreter.h"
#include "settings.h"

namespace twengine
{

namespace
{

bool isTiff(const Glib::ustring& path)
{
    const Glib::ustring::size_type dot = path.rfind('.');

    if (dot == Glib::ustring::npos) {
        return false;
    }

    const Glib::ustring ext = path.substr(dot).lowercase();
    return ext == ".tif" || ext == ".tiff";
}

// the engine reads one argument per line
bool fitsOnOneLine(const Glib::ustring& path)
{
    return path.raw().find_first_of(std::string("\r\n\0", 3)) == std::string::npos;
}

}

MetadataManager::MetadataManager(EngineSupervisor& engine) :
    engine_(engine),
    last_status_(EngineSupervisor::OK)
{
}

bool MetadataManager::checkFile(const Glib::ustring& path)
{
    if (!fitsOnOneLine(path)) {
        last_error_ = "file names with line breaks are not supported: " + path;
        return false;
    }

    if (!Glib::file_test(path, Glib::FILE_TEST_EXISTS)) {
        last_error_ = "file not found: " + path;
        return false;
    }

    return true;
}

bool MetadataManager::run(const std::vector<Glib::ustring>& args, Glib::ustring& output)
{
    last_status_ = engine_.execute(args, output);

    if (last_status_ == EngineSupervisor::OK) {
        last_error_.clear();
        return true;
    }

    last_error_ = Glib::ustring(EngineSupervisor::statusName(last_status_)) + ": " + engine_.getLastError();

    if (settings->verbose) {
        std::cerr << "MetadataManager / " << last_error_ << std::endl;
    }

    return false;
}

RawMetadata MetadataManager::readTags(const Glib::ustring& path)
{
    std::vector<Glib::ustring> args;
    args.push_back("-j");

    // TIFF files written by scanners often carry minor format errors
    if (isTiff(path)) {
        args.push_back("-m");
    }

    args.push_back(path);

    Glib::ustring output;

    if (!run(args, output)) {
        return RawMetadata();
    }

    return ResultInterpreter::parseRead(output);
}

bool MetadataManager::loadFromFile(const Glib::ustring& path)
{
    if (!checkFile(path)) {
        return false;
    }

    const RawMetadata raw = readTags(path);

    if (last_status_ != EngineSupervisor::OK) {
        record_.clear();
        return false;
    }

    record_ = FieldResolver::normalizeRead(raw);
    current_file_ = path;
    return true;
}

RawMetadata MetadataManager::readAllTags(const Glib::ustring& path)
{
    if (!checkFile(path)) {
        return RawMetadata();
    }

    return readTags(path);
}

Glib::ustring MetadataManager::getField(const Glib::ustring& name, const Glib::ustring& def) const
{
    return record_.get(name, def);
}

void MetadataManager::setField(const Glib::ustring& name, const Glib::ustring& value)
{
    record_.set(name, value);
}

void MetadataManager::clear()
{
    record_.clear();
}

std::vector<Glib::ustring> MetadataManager::getFieldNames() const
{
    std::vector<Glib::ustring> names;

    for (const auto field : FieldResolver::getFields()) {
        names.push_back(FieldResolver::getName(field));
    }

    return names;
}

Glib::ustring MetadataManager::escapeValue(const Glib::ustring& value)
{
    std::string escaped;
    escaped.reserve(value.bytes());

    for (const char c : value.raw()) {
        switch (c) {
            case '&':
                escaped += "&amp;";
                break;

            case '<':
                escaped += "&lt;";
                break;

            case '>':
                escaped += "&gt;";
                break;

            case '"':
                escaped += "&quot;";
                break;

            case '\'':
                escaped += "&#39;";
                break;

            case '\n':
                escaped += "&#xa;";
                break;

            default:
                escaped += c;
        }
    }

    return escaped;
}

std::vector<Glib::ustring> MetadataManager::buildWriteCommand(const WriteArguments& args, const Glib::ustring& path)
{
    std::vector<Glib::ustring> command;
    command.push_back("-E");

    for (const auto& arg : args) {
        // a tag name cannot span lines of the argument stream
        if (arg.tag.find_first_of("\r\n=") != Glib::ustring::npos) {
            if (settings->verbose) {
                std::cerr << "MetadataManager::buildWriteCommand / invalid tag name skipped" << std::endl;
            }

            continue;
        }

        command.push_back("-" + arg.tag + "=" + escapeValue(arg.value));
    }

    command.push_back("-overwrite_original");
    command.push_back(path);
    return command;
}

bool MetadataManager::saveToFile(const Glib::ustring& path)
{
    if (!checkFile(path)) {
        return false;
    }

    const WriteArguments args = FieldResolver::normalizeWrite(record_);

    if (args.empty()) {
        return true;
    }

    Glib::ustring output;

    if (!run(buildWriteCommand(args, path), output)) {
        return false;
    }

    if (!ResultInterpreter::parseWriteResult(output)) {
        last_error_ = "the file was not updated: " + output;
        return false;
    }

    return true;
}

bool MetadataManager::exportToJson(const Glib::ustring& path) const
{
    nlohmann::json metadata = nlohmann::json::object();

    for (const auto& entry : record_.getFields()) {
        metadata[FieldResolver::getName(entry.first).raw()] = entry.second.raw();
    }

    for (const auto& entry : record_.getCustom()) {
        metadata[entry.first.raw()] = entry.second.raw();
    }

    nlohmann::json data;
    data["filename"] = current_file_.empty() ? std::string("unknown") : Glib::path_get_basename(current_file_);
    data["export_date"] = Glib::DateTime::create_now_local().format("%Y-%m-%d %H:%M:%S").raw();
    data["metadata"] = metadata;

    try {
        Glib::file_set_contents(path, data.dump(4, ' ', false, nlohmann::json::error_handler_t::replace) + "\n");
    } catch (const Glib::FileError& e) {
        last_error_ = e.what();

        if (settings->verbose) {
            std::cerr << "MetadataManager::exportToJson / " << last_error_ << std::endl;
        }

        return false;
    }

    return true;
}

bool MetadataManager::importFromJson(const Glib::ustring& path)
{
    std::string contents;

    try {
        contents = Glib::file_get_contents(path);
    } catch (const Glib::FileError& e) {
        last_error_ = e.what();
        return false;
    }

    const nlohmann::json data = nlohmann::json::parse(contents, nullptr, false);

    if (data.is_discarded() || !data.is_object()) {
        last_error_ = path + " does not hold a JSON object";
        return false;
    }

    const auto metadata = data.find("metadata");
    const nlohmann::json& values = metadata != data.end() && metadata->is_object() ? *metadata : data;

    for (const auto field : FieldResolver::getFields()) {
        const auto value = values.find(FieldResolver::getName(field).raw());

        if (value != values.end()) {
            record_.set(field, ResultInterpreter::jsonValueToText(*value));
        }
    }

    return true;
}

}
