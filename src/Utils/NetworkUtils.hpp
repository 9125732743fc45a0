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
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace BrowserJar {
	namespace Utils {
		namespace NetworkUtils {

			struct Error {
				std::string message;
				std::string context;

				bool HasError() const noexcept { return !message.empty(); }
				void Clear() noexcept { message.clear(); context.clear(); }
			};

			// ============================================================================
			// URL
			// ============================================================================

			struct UrlComponents {
				std::string scheme;      // lower-cased: http, https, ...
				std::string username;
				std::string password;
				std::string host;        // lower-cased, IPv6 brackets removed
				uint16_t port = 0;       // 0 when not given
				std::string path;        // always starts with '/'
				std::string query;
				std::string fragment;
			};

			/**
			 * @brief Split an absolute URL into its components.
			 *
			 * Accepts "scheme://[user[:pass]@]host[:port][/path][?query][#fragment]".
			 * A URL that parses but carries no authority leaves host empty.
			 *
			 * @return false when the URL has no scheme or the port is invalid
			 */
			bool ParseUrl(std::string_view url, UrlComponents& components, Error* err = nullptr) noexcept;

			/// Default port for http/https, 0 otherwise
			uint16_t DefaultPortForScheme(std::string_view scheme) noexcept;

		} // namespace NetworkUtils
	} // namespace Utils
} // namespace BrowserJar
