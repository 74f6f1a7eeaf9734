#include "docs_handler.hpp"
#include "logger.hpp"
#include <boost/beast/http/verb.hpp>
#include <cctype>
#include <sstream>

namespace accounts {

OpenApiGenerator::OpenApiGenerator(const RouteTable &table) : table_(table) {}

nlohmann::ordered_json OpenApiGenerator::generate() const {
  nlohmann::ordered_json document;
  document["openapi"] = OPENAPI_VERSION;
  document["info"] = renderInfo();

  nlohmann::ordered_json paths = nlohmann::ordered_json::object();
  for (const auto &route : table_.routes()) {
    if (!route.documented) {
      continue;
    }
    std::string method(boost::beast::http::to_string(route.method));
    for (auto &c : method) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    paths[route.documentedPath][method] = renderOperation(route);
  }
  document["paths"] = std::move(paths);

  nlohmann::ordered_json schemas = nlohmann::ordered_json::object();
  for (const auto &schema : table_.schemas()) {
    schemas[schema.name] = renderSchema(schema);
  }
  document["components"]["schemas"] = std::move(schemas);

  return document;
}

nlohmann::ordered_json OpenApiGenerator::renderInfo() const {
  const ApiInfo &info = table_.info();
  nlohmann::ordered_json json;
  json["title"] = info.title;
  if (!info.description.empty()) {
    json["description"] = info.description;
  }
  json["version"] = info.version;
  return json;
}

nlohmann::ordered_json
OpenApiGenerator::renderOperation(const RouteDescriptor &route) const {
  nlohmann::ordered_json op;
  if (!route.tags.empty()) {
    op["tags"] = route.tags;
  }
  if (!route.summary.empty()) {
    op["summary"] = route.summary;
  }
  if (!route.description.empty()) {
    op["description"] = route.description;
  }
  op["operationId"] = route.operationId;

  if (!route.parameters.empty()) {
    nlohmann::ordered_json params = nlohmann::ordered_json::array();
    for (const auto &param : route.parameters) {
      params.push_back(renderParameter(param));
    }
    op["parameters"] = std::move(params);
  }

  nlohmann::ordered_json responses = nlohmann::ordered_json::object();
  for (const auto &response : route.responses) {
    nlohmann::ordered_json entry;
    entry["description"] = response.description;
    if (!response.schemaRef.empty()) {
      entry["content"][response.contentType]["schema"]["$ref"] =
          "#/components/schemas/" + response.schemaRef;
    }
    responses[std::to_string(response.status)] = std::move(entry);
  }
  op["responses"] = std::move(responses);

  return op;
}

nlohmann::ordered_json
OpenApiGenerator::renderParameter(const ParameterDescriptor &param) const {
  nlohmann::ordered_json json;
  json["name"] = param.name;
  json["in"] = param.location;
  if (!param.description.empty()) {
    json["description"] = param.description;
  }
  json["required"] = param.required;
  json["schema"]["type"] = param.type;
  if (!param.format.empty()) {
    json["schema"]["format"] = param.format;
  }
  return json;
}

nlohmann::ordered_json
OpenApiGenerator::renderSchema(const SchemaDescription &schema) const {
  nlohmann::ordered_json json;
  json["type"] = "object";
  if (!schema.title.empty()) {
    json["title"] = schema.title;
  }
  if (!schema.description.empty()) {
    json["description"] = schema.description;
  }

  nlohmann::ordered_json required = nlohmann::ordered_json::array();
  nlohmann::ordered_json properties = nlohmann::ordered_json::object();
  for (const auto &field : schema.fields) {
    nlohmann::ordered_json property;
    property["type"] = field.type;
    if (!field.format.empty()) {
      property["format"] = field.format;
    }
    if (!field.description.empty()) {
      property["description"] = field.description;
    }
    if (!field.example.is_null()) {
      property["example"] = field.example;
    }
    properties[field.name] = std::move(property);
    if (field.required) {
      required.push_back(field.name);
    }
  }
  if (!required.empty()) {
    json["required"] = std::move(required);
  }
  json["properties"] = std::move(properties);
  return json;
}

DocsHandler::DocsHandler(const RouteTable &table, DocsConfig docsConfig,
                         ResponseBuilder::ResponseConfig responseConfig)
    : docsConfig_(std::move(docsConfig)),
      responseConfig_(std::move(responseConfig)) {
  descriptionJson_ = OpenApiGenerator(table).generate().dump();
  html_ = renderHtml(table.info().title, descriptionJson_, docsConfig_);
  DOCS_LOG_INFO("API reference rendered ({} bytes, theme {})", html_.size(),
                docsConfig_.theme);
}

HttpResponse DocsHandler::referencePage(unsigned version,
                                        bool keepAlive) const {
  ResponseBuilder builder(responseConfig_);
  return builder.setVersion(version).setKeepAlive(keepAlive).success(
      html_, ResponseBuilder::ContentType::HTML);
}

HttpResponse DocsHandler::apiDescription(unsigned version,
                                         bool keepAlive) const {
  ResponseBuilder builder(responseConfig_);
  return builder.setVersion(version).setKeepAlive(keepAlive).success(
      descriptionJson_, ResponseBuilder::ContentType::JSON);
}

std::string DocsHandler::renderHtml(const std::string &title,
                                    const std::string &descriptionJson,
                                    const DocsConfig &docsConfig) {
  nlohmann::json configuration = {{"theme", docsConfig.theme}};

  std::ostringstream html;
  html << "<!doctype html>\n"
       << "<html>\n"
       << "<head>\n"
       << "    <title>" << escapeHtml(title) << "</title>\n"
       << "    <meta charset=\"utf-8\"/>\n"
       << "    <meta\n"
       << "            name=\"viewport\"\n"
       << "            content=\"width=device-width, initial-scale=1\"/>\n"
       << "</head>\n"
       << "<body>\n"
       << "\n"
       << "<script\n"
       << "        id=\"api-reference\"\n"
       << "        data-configuration='"
       << escapeSingleQuotedAttribute(configuration.dump())
       << "'\n"
       << "        type=\"application/json\">\n"
       << "    " << escapeForScript(descriptionJson) << "\n"
       << "</script>\n"
       << "<script src=\"" << escapeHtml(docsConfig.cdnUrl)
       << "\"></script>\n"
       << "</body>\n"
       << "</html>\n";
  return html.str();
}

std::string DocsHandler::escapeForScript(const std::string &json) {
  std::string escaped;
  escaped.reserve(json.size());
  for (size_t i = 0; i < json.size(); ++i) {
    if (json[i] == '<' && i + 1 < json.size() && json[i + 1] == '/') {
      escaped += "<\\/";
      ++i;
    } else if (json[i] == '<' && json.compare(i, 4, "<!--") == 0) {
      escaped += "\\u003c!--";
      i += 3;
    } else {
      escaped += json[i];
    }
  }
  return escaped;
}

std::string DocsHandler::escapeSingleQuotedAttribute(const std::string &text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    if (c == '&')
      escaped += "&amp;";
    else if (c == '\'')
      escaped += "&#39;";
    else
      escaped += c;
  }
  return escaped;
}

std::string DocsHandler::escapeHtml(const std::string &text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
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
    case '\'':
      escaped += "&#39;";
      break;
    case '"':
      escaped += "&quot;";
      break;
    default:
      escaped += c;
    }
  }
  return escaped;
}

} // namespace accounts
