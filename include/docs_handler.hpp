#pragma once

#include "config_manager.hpp"
#include "exception_mapper.hpp"
#include "response_builder.hpp"
#include "route_table.hpp"
#include "router.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace accounts {

/**
 * @brief Renders an OpenAPI 3.1 description from a RouteTable.
 *
 * Only routes marked `documented` are published, keyed by their
 * `documentedPath`. Schema fields keep their declaration order.
 */
class OpenApiGenerator {
public:
  static constexpr const char *OPENAPI_VERSION = "3.1.0";

  explicit OpenApiGenerator(const RouteTable &table);

  nlohmann::ordered_json generate() const;

  nlohmann::ordered_json renderInfo() const;
  nlohmann::ordered_json renderOperation(const RouteDescriptor &route) const;
  nlohmann::ordered_json renderParameter(const ParameterDescriptor &param) const;
  nlohmann::ordered_json renderSchema(const SchemaDescription &schema) const;

private:
  const RouteTable &table_;
};

/**
 * @brief Serves the API reference page and the raw API description.
 *
 * Both bodies are rendered once at construction.
 */
class DocsHandler {
public:
  DocsHandler(const RouteTable &table, DocsConfig docsConfig,
              ResponseBuilder::ResponseConfig responseConfig);

  HttpResponse referencePage(unsigned version, bool keepAlive) const;
  HttpResponse apiDescription(unsigned version, bool keepAlive) const;

  const std::string &html() const { return html_; }
  const std::string &descriptionJson() const { return descriptionJson_; }

  static std::string renderHtml(const std::string &title,
                                const std::string &descriptionJson,
                                const DocsConfig &docsConfig);
  // Makes JSON safe to embed in a <script> element
  static std::string escapeForScript(const std::string &json);
  static std::string escapeHtml(const std::string &text);
  static std::string escapeSingleQuotedAttribute(const std::string &text);

private:
  DocsConfig docsConfig_;
  ResponseBuilder::ResponseConfig responseConfig_;
  std::string descriptionJson_;
  std::string html_;
};

} // namespace accounts
