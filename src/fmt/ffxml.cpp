//
// Project FFTrim - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "fftrim/fmt/ffxml.h"

#include <climits>
#include <filesystem>
#include <fstream>
#include <ios>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <absl/base/optimization.h>
#include <absl/log/absl_log.h>
#include <absl/strings/ascii.h>
#include <libxml/globals.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include "fftrim/core/attributes.h"
#include "fftrim/core/forcefield.h"

namespace fftrim {
namespace {
struct XmlDocDeleter {
  void operator()(xmlDoc *doc) const noexcept { xmlFreeDoc(doc); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct XmlCharDeleter {
  void operator()(xmlChar *str) const noexcept { xmlFree(str); }
};

using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

constexpr int kParseOptions = XML_PARSE_NOBLANKS | XML_PARSE_NONET;

const char *as_chars(const xmlChar *str) {
  return reinterpret_cast<const char *>(str);
}

const xmlChar *as_xml(const std::string &str) {
  return reinterpret_cast<const xmlChar *>(str.c_str());
}

bool is_element(const xmlNode *node) {
  return node->type == XML_ELEMENT_NODE;
}

void log_xml_error() {
  const xmlError *err = xmlGetLastError();
  if (err == nullptr || err->message == nullptr) {
    ABSL_LOG(WARNING) << "Failed to parse XML document";
    return;
  }

  ABSL_LOG(WARNING) << "Failed to parse XML document (line " << err->line
                    << "): "
                    << absl::StripTrailingAsciiWhitespace(err->message);
}

AttributeList read_attrs(xmlDoc *doc, const xmlNode *node) {
  AttributeList attrs;

  for (const xmlAttr *attr = node->properties; attr != nullptr;
       attr = attr->next) {
    XmlCharPtr value(xmlNodeListGetString(doc, attr->children, 1));
    attrs.emplace_back(as_chars(attr->name),
                       value ? as_chars(value.get()) : "");
  }

  return attrs;
}

void read_section(ForceField &ff, xmlDoc *doc, const xmlNode *node) {
  ForceFieldSection &sec = ff.add_section(
      ForceFieldSection(as_chars(node->name), read_attrs(doc, node)));

  for (const xmlNode *child = node->children; child != nullptr;
       child = child->next) {
    if (!is_element(child))
      continue;

    ForceFieldRecord &record = sec.add_record(
        ForceFieldRecord(as_chars(child->name), read_attrs(doc, child)));

    ABSL_LOG_IF(INFO, xmlFirstElementChild(const_cast<xmlNode *>(child))
                          != nullptr)
        << "Ignoring child elements of " << record.tag() << " record in "
        << sec.name();
  }
}

ForceField read_document(xmlDoc *doc) {
  ForceField ff;

  const xmlNode *root = xmlDocGetRootElement(doc);
  if (ABSL_PREDICT_FALSE(root == nullptr)) {
    ABSL_LOG(WARNING) << "XML document has no root element";
    return ff;
  }

  ff.root_tag() = as_chars(root->name);
  ff.attrs() = read_attrs(doc, root);

  for (const xmlNode *node = root->children; node != nullptr;
       node = node->next) {
    if (is_element(node))
      read_section(ff, doc, node);
  }

  return ff;
}

void write_attrs(xmlNode *node, const AttributeList &attrs) {
  for (const auto &[key, value]: attrs)
    xmlSetProp(node, as_xml(key), as_xml(value));
}

XmlDocPtr build_document(const ForceField &ff) {
  XmlDocPtr doc(xmlNewDoc(reinterpret_cast<const xmlChar *>("1.0")));
  if (ABSL_PREDICT_FALSE(doc == nullptr))
    return doc;

  xmlNode *root =
      xmlNewDocNode(doc.get(), nullptr, as_xml(ff.root_tag()), nullptr);
  if (ABSL_PREDICT_FALSE(root == nullptr)) {
    doc.reset();
    return doc;
  }

  xmlDocSetRootElement(doc.get(), root);
  write_attrs(root, ff.attrs());

  for (const ForceFieldSection &sec: ff.sections()) {
    xmlNode *sec_node = xmlNewChild(root, nullptr, as_xml(sec.name()), nullptr);
    if (ABSL_PREDICT_FALSE(sec_node == nullptr)) {
      doc.reset();
      return doc;
    }

    write_attrs(sec_node, sec.attrs());

    for (const ForceFieldRecord &record: sec.records()) {
      xmlNode *rec_node =
          xmlNewChild(sec_node, nullptr, as_xml(record.tag()), nullptr);
      if (ABSL_PREDICT_FALSE(rec_node == nullptr)) {
        doc.reset();
        return doc;
      }

      write_attrs(rec_node, record.attrs());
    }
  }

  return doc;
}

class IndentGuard {
public:
  IndentGuard(): indent_(xmlIndentTreeOutput), str_(xmlTreeIndentString) {
    xmlIndentTreeOutput = 1;
    xmlTreeIndentString = "\t";
  }

  IndentGuard(const IndentGuard &) = delete;
  IndentGuard &operator=(const IndentGuard &) = delete;

  ~IndentGuard() noexcept {
    xmlIndentTreeOutput = indent_;
    xmlTreeIndentString = str_;
  }

private:
  int indent_;
  const char *str_;
};
}  // namespace

ForceField read_forcefield_xml(std::string_view xml) {
  if (ABSL_PREDICT_FALSE(xml.size() > INT_MAX)) {
    ABSL_LOG(WARNING) << "XML document too large";
    return {};
  }

  XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()),
                              nullptr, nullptr, kParseOptions));
  if (!doc) {
    log_xml_error();
    return {};
  }

  return read_document(doc.get());
}

ForceField read_forcefield_xml_file(const std::filesystem::path &path) {
  XmlDocPtr doc(xmlReadFile(path.c_str(), nullptr, kParseOptions));
  if (!doc) {
    ABSL_LOG(WARNING) << "Failed to read force field file " << path;
    log_xml_error();
    return {};
  }

  return read_document(doc.get());
}

bool write_forcefield_xml(std::string &out, const ForceField &ff) {
  XmlDocPtr doc = build_document(ff);
  if (ABSL_PREDICT_FALSE(!doc)) {
    ABSL_LOG(WARNING) << "Failed to build XML document";
    return false;
  }

  xmlChar *buf = nullptr;
  int size = 0;
  {
    IndentGuard guard;
    xmlDocDumpFormatMemoryEnc(doc.get(), &buf, &size, "UTF-8", 1);
  }

  XmlCharPtr data(buf);
  if (ABSL_PREDICT_FALSE(!data || size < 0)) {
    ABSL_LOG(WARNING) << "Failed to serialize XML document";
    return false;
  }

  out.append(as_chars(data.get()), size);
  return true;
}

bool write_forcefield_xml_file(const std::filesystem::path &path,
                               const ForceField &ff) {
  std::string data;
  if (!write_forcefield_xml(data, ff))
    return false;

  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    ABSL_LOG(WARNING) << "Failed to open " << path << " for writing";
    return false;
  }

  ofs << data;
  ofs.flush();
  if (!ofs) {
    ABSL_LOG(WARNING) << "Failed to write " << path;
    return false;
  }

  return true;
}
}  // namespace fftrim
