#include "nsclient/xml_response.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <cctype>
#include <memory>
#include <mutex>

namespace nsclient {

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct XmlCharDeleter {
    void operator()(xmlChar* s) const { xmlFree(s); }
};
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

std::string to_string(const xmlChar* s) {
    return s ? std::string(reinterpret_cast<const char*>(s)) : std::string();
}

// Attribute set of one element as a JSON object
nlohmann::json attributes_of(xmlDoc* doc, xmlNode* node) {
    nlohmann::json attrs = nlohmann::json::object();
    for (xmlAttr* attr = node->properties; attr; attr = attr->next) {
        XmlCharPtr value(xmlNodeListGetString(doc, attr->children, 1));
        attrs[to_string(attr->name)] = to_string(value.get());
    }
    return attrs;
}

} // namespace

bool looks_like_xml(const std::string& body) {
    if (body.compare(0, 5, "<?xml") != 0 || body.size() < 6) {
        return false;
    }
    return std::isspace(static_cast<unsigned char>(body[5])) != 0;
}

ParsedResponse parse_structured_response(const std::string& body) {
    static std::once_flag xml_init_flag;
    std::call_once(xml_init_flag, []() { xmlInitParser(); });

    ParsedResponse result;

    XmlDocPtr doc(xmlReadMemory(body.data(), static_cast<int>(body.size()),
                                "response.xml", nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        const xmlError* err = xmlGetLastError();
        result.error_message = "Failed to parse XML response";
        if (err && err->message) {
            std::string detail = err->message;
            while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
                detail.pop_back();
            }
            result.error_message += ": " + detail;
        }
        return result;
    }

    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        result.error_message = "XML response has no root element";
        return result;
    }

    nlohmann::json element = nlohmann::json::object();
    if (root->properties) {
        element["attribs"] = attributes_of(doc.get(), root);
    }

    for (xmlNode* child = root->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;
        std::string name = to_string(child->name);
        if (!element.contains(name)) {
            element[name] = nlohmann::json::array();
        }
        element[name].push_back(attributes_of(doc.get(), child));
    }

    result.data = nlohmann::json::object();
    result.data[to_string(root->name)] = std::move(element);
    result.success = true;
    return result;
}

}  // namespace nsclient
