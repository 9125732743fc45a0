/*
 * BrowserJar - Browser Cookie Extraction Engine
 * Copyright (C) 2026 BrowserJar Project
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "pch.h"
#include "JSONUtils.hpp"
#include "FileUtils.hpp"

namespace BrowserJar {
	namespace Utils {
		namespace JSON {

			namespace {

				void setError(Error* err, std::string msg, const std::filesystem::path& path = {}, size_t offset = 0) {
					if (!err) return;
					err->message = std::move(msg);
					err->path = path;
					err->byteOffset = offset;
				}

				/// Nesting depth of an already parsed document
				size_t DepthOf(const Json& j, size_t limit, size_t current = 1) {
					if (current > limit) return current;
					size_t deepest = current;
					if (j.is_object() || j.is_array()) {
						for (const auto& child : j) {
							if (child.is_object() || child.is_array()) {
								deepest = std::max(deepest, DepthOf(child, limit, current + 1));
								if (deepest > limit) break;
							}
						}
					}
					return deepest;
				}

			} // anonymous namespace

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				try {
					out = Json::parse(jsonText.begin(), jsonText.end(), nullptr, true, opt.allowComments);
				}
				catch (const Json::parse_error& ex) {
					out = Json();
					setError(err, ex.what(), {}, ex.byte);
					return false;
				}
				catch (const std::exception& ex) {
					out = Json();
					setError(err, ex.what());
					return false;
				}

				if (DepthOf(out, opt.maxDepth) > opt.maxDepth) {
					out = Json();
					setError(err, "JSON nesting exceeds maximum depth");
					return false;
				}
				return true;
			}

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				try {
					std::error_code ec;
					const auto size = std::filesystem::file_size(path, ec);
					if (ec) {
						setError(err, "Cannot read JSON file: " + ec.message(), path);
						return false;
					}
					if (size > maxBytes) {
						setError(err, "JSON file too large", path);
						return false;
					}

					std::string text;
					FileUtils::Error ferr;
					if (!FileUtils::ReadAllTextUtf8(path, text, &ferr)) {
						setError(err, ferr.message, path);
						return false;
					}

					if (!Parse(text, out, err, opt)) {
						if (err) err->path = path;
						return false;
					}
					return true;
				}
				catch (const std::exception& ex) {
					setError(err, ex.what(), path);
					return false;
				}
			}

			std::optional<std::string> GetString(const Json& j, std::string_view key) noexcept {
				if (!j.is_object()) return std::nullopt;
				const auto it = j.find(std::string(key));
				if (it == j.end() || !it->is_string()) return std::nullopt;
				try {
					return it->get<std::string>();
				}
				catch (const std::exception&) {
					return std::nullopt;
				}
			}

			std::optional<int64_t> GetInt64(const Json& j, std::string_view key) noexcept {
				if (!j.is_object()) return std::nullopt;
				const auto it = j.find(std::string(key));
				if (it == j.end() || !it->is_number_integer()) return std::nullopt;
				return it->get<int64_t>();
			}

		} // namespace JSON
	} // namespace Utils
} // namespace BrowserJar
