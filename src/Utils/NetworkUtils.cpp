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
#include "NetworkUtils.hpp"
#include "StringUtils.hpp"

#include <cctype>

namespace BrowserJar {
	namespace Utils {
		namespace NetworkUtils {

			namespace {

				void setError(Error* err, std::string msg) {
					if (!err) return;
					err->message = std::move(msg);
					err->context = "ParseUrl";
				}

				bool IsSchemeChar(char c) noexcept {
					return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
				}

			} // anonymous namespace

			uint16_t DefaultPortForScheme(std::string_view scheme) noexcept {
				if (StringUtils::EqualsIgnoreCase(scheme, "http")) return 80;
				if (StringUtils::EqualsIgnoreCase(scheme, "https")) return 443;
				return 0;
			}

			bool ParseUrl(std::string_view url, UrlComponents& components, Error* err) noexcept {
				components = UrlComponents{};
				try {
					url = StringUtils::TrimView(url);

					const size_t colon = url.find(':');
					if (colon == std::string_view::npos || colon == 0) {
						setError(err, "URL has no scheme");
						return false;
					}
					for (size_t i = 0; i < colon; ++i) {
						if (!IsSchemeChar(url[i]) || (i == 0 && !std::isalpha(static_cast<unsigned char>(url[i])))) {
							setError(err, "Invalid URL scheme");
							return false;
						}
					}
					components.scheme = StringUtils::ToLowerAscii(url.substr(0, colon));
					std::string_view rest = url.substr(colon + 1);

					// Fragment and query apply to every form
					if (const size_t hash = rest.find('#'); hash != std::string_view::npos) {
						components.fragment = std::string(rest.substr(hash + 1));
						rest = rest.substr(0, hash);
					}
					if (const size_t q = rest.find('?'); q != std::string_view::npos) {
						components.query = std::string(rest.substr(q + 1));
						rest = rest.substr(0, q);
					}

					std::string_view pathPart = rest;
					if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '/') {
						rest = rest.substr(2);
						const size_t slash = rest.find('/');
						std::string_view authority = rest.substr(0, slash);
						pathPart = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);

						if (const size_t at = authority.rfind('@'); at != std::string_view::npos) {
							std::string_view userinfo = authority.substr(0, at);
							authority = authority.substr(at + 1);
							std::string_view user, pass;
							if (StringUtils::SplitOnce(userinfo, ":", user, pass)) {
								components.username = std::string(user);
								components.password = std::string(pass);
							}
							else {
								components.username = std::string(userinfo);
							}
						}

						std::string_view hostPart = authority;
						std::string_view portPart;
						if (!authority.empty() && authority.front() == '[') {
							const size_t close = authority.find(']');
							if (close == std::string_view::npos) {
								setError(err, "Unterminated IPv6 literal");
								return false;
							}
							hostPart = authority.substr(1, close - 1);
							std::string_view after = authority.substr(close + 1);
							if (!after.empty()) {
								if (after.front() != ':') {
									setError(err, "Unexpected characters after IPv6 literal");
									return false;
								}
								portPart = after.substr(1);
							}
						}
						else if (const size_t pc = authority.rfind(':'); pc != std::string_view::npos) {
							hostPart = authority.substr(0, pc);
							portPart = authority.substr(pc + 1);
						}

						if (!portPart.empty()) {
							uint32_t port = 0;
							for (const char c : portPart) {
								if (c < '0' || c > '9') {
									setError(err, "Invalid port");
									return false;
								}
								port = port * 10 + static_cast<uint32_t>(c - '0');
								if (port > 65535) {
									setError(err, "Port out of range");
									return false;
								}
							}
							components.port = static_cast<uint16_t>(port);
						}

						components.host = StringUtils::ToLowerAscii(hostPart);
					}

					components.path = pathPart.empty() ? std::string("/") : std::string(pathPart);
					if (components.path.front() != '/') components.path.insert(components.path.begin(), '/');
					return true;
				}
				catch (const std::exception& ex) {
					components = UrlComponents{};
					setError(err, ex.what());
					return false;
				}
			}

		} // namespace NetworkUtils
	} // namespace Utils
} // namespace BrowserJar
