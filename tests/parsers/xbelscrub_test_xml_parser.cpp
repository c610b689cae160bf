#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "xbelscrub/parsers/xml.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace xbelscrub::parsers::xml;

namespace
{
/// Concatenated raw bytes of all tokens; empty and error set on failure.
std::string rejoin(Parser &parser)
{
  std::string out;
  while (parser.next())
  {
    out.append(parser.current().raw);
  }
  return out;
}

std::vector<TokenKind> kinds(const std::string &xml)
{
  Parser parser(xml);
  std::vector<TokenKind> result;
  while (parser.next())
  {
    result.push_back(parser.current().kind);
  }
  REQUIRE(parser.error() == nullptr);
  return result;
}

std::string errorMessage(const std::string &xml)
{
  Parser parser(xml);
  while (parser.next())
  {
  }
  REQUIRE(parser.error() != nullptr);
  return parser.error()->message;
}
} // namespace

TEST_CASE("XML Parser - Basic Parsing", "[xml][parser][basic]")
{
  SECTION("Simple element parsing")
  {
    std::string xml = "<root>hello</root>";
    Parser parser(xml);

    REQUIRE(parser.next());
    const auto &tok1 = parser.current();
    REQUIRE(tok1.kind == TokenKind::StartElement);
    REQUIRE(tok1.name == "root");
    REQUIRE(tok1.raw == "<root>");
    REQUIRE(tok1.depth == 1);

    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::Text);
    REQUIRE(parser.current().text == "hello");
    REQUIRE(parser.current().depth == 1);

    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::EndElement);
    REQUIRE(parser.current().name == "root");
    REQUIRE(parser.current().raw == "</root>");

    REQUIRE_FALSE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::Eof);
    REQUIRE(parser.error() == nullptr);
    REQUIRE_FALSE(parser.next());
  }

  SECTION("Empty element parsing")
  {
    Parser parser(std::string("<empty />"));

    REQUIRE(parser.next());
    const auto &tok = parser.current();
    REQUIRE(tok.kind == TokenKind::EmptyElement);
    REQUIRE(tok.name == "empty");
    REQUIRE(tok.selfClosing);
    REQUIRE(tok.depth == 1);
    REQUIRE(tok.raw == "<empty />");

    REQUIRE_FALSE(parser.next());
    REQUIRE(parser.error() == nullptr);
  }

  SECTION("Element with attributes")
  {
    std::string xml = "<elem attr1=\"value1\" attr2 = 'value2' attr3=\"a&amp;b\">content</elem>";
    Parser parser(xml);

    REQUIRE(parser.next());
    const auto &tok = parser.current();
    REQUIRE(tok.kind == TokenKind::StartElement);
    REQUIRE(tok.attributes.size() == 3);
    REQUIRE(tok.attributes[0].name == "attr1");
    REQUIRE(tok.attributes[0].value == "value1");
    REQUIRE(tok.attributes[1].name == "attr2");
    REQUIRE(tok.attributes[1].value == "value2");
    // values are raw slices
    REQUIRE(tok.attributes[2].value == "a&amp;b");
  }

  SECTION("Repeated attributes are all reported")
  {
    Parser parser(std::string("<b href=\"1\" x=\"y\" href=\"2\"/>"));
    REQUIRE(parser.next());
    auto values = parser.current().attributeValues("href");
    REQUIRE(values.size() == 2);
    REQUIRE(values[0] == "1");
    REQUIRE(values[1] == "2");
    REQUIRE(parser.current().attributeValues("missing").empty());
  }
}

TEST_CASE("XML Parser - Lossless Tokens", "[xml][parser][raw]")
{
  SECTION("Whitespace between markup is reported as text")
  {
    std::vector<TokenKind> expected{TokenKind::XmlDecl,    TokenKind::Text,
                                    TokenKind::StartElement, TokenKind::Text,
                                    TokenKind::EmptyElement, TokenKind::Text,
                                    TokenKind::EndElement,   TokenKind::Text};
    REQUIRE(kinds("<?xml version=\"1.0\"?>\n<a>\n  <b/>\n</a>\n") == expected);
  }

  SECTION("Raw bytes reproduce the document")
  {
    std::string xml = "<?xml version='1.0' encoding=\"UTF-8\" ?>\r\n"
                      "<!DOCTYPE xbel [ <!ENTITY x \"y\"> ]>\n"
                      "<!--c-->\n"
                      "<xbel  version = \"1.0\"\n      xmlns:b=\"urn:x\" >\n"
                      "\t<b:item\tname='&lt;n&gt;' />\n"
                      "\t<data><![CDATA[a <b> ]] c]]>&#x41;&amp;</data>\n"
                      "\t<?pi  body ?>\n"
                      "</xbel >\n";
    Parser parser(xml);
    REQUIRE(rejoin(parser) == xml);
    REQUIRE(parser.error() == nullptr);
  }

  SECTION("Non-UTF-8 bytes are passed through")
  {
    std::string xml = "<r a=\"\xFF\xFE\">caf\xE9</r>";
    Parser parser(xml);
    REQUIRE(rejoin(parser) == xml);
    REQUIRE(parser.error() == nullptr);
  }

  SECTION("Leading byte order mark is kept")
  {
    std::string xml = "\xEF\xBB\xBF<?xml version=\"1.0\"?>\n<a/>\n";
    Parser parser(xml);
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::Text);
    REQUIRE(parser.current().raw == "\xEF\xBB\xBF");
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::XmlDecl);

    Parser again(xml);
    REQUIRE(rejoin(again) == xml);
    REQUIRE(again.error() == nullptr);
  }

  SECTION("Names may contain non-ASCII bytes")
  {
    Parser parser(std::string("<\xC3\xA9l\xC3\xA9ment/>"));
    REQUIRE(parser.next());
    REQUIRE(parser.current().name == "\xC3\xA9l\xC3\xA9ment");
  }

  SECTION("Offsets and positions")
  {
    Parser parser(std::string("<a>\n  <b/></a>"));
    REQUIRE(parser.next());
    REQUIRE(parser.next());
    REQUIRE(parser.next());
    const auto &b = parser.current();
    REQUIRE(b.kind == TokenKind::EmptyElement);
    REQUIRE(b.offset == 6);
    REQUIRE(b.line == 2);
    REQUIRE(b.column == 3);
    REQUIRE(parser.position() == 10);
  }
}

TEST_CASE("XML Parser - Special Content", "[xml][parser][special]")
{
  SECTION("CDATA section")
  {
    Parser parser(std::string("<root><![CDATA[<tag>&amp;</tag>]]></root>"));
    REQUIRE(parser.next());
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::CData);
    REQUIRE(parser.current().text == "<tag>&amp;</tag>");
  }

  SECTION("Comments")
  {
    Parser parser(std::string("<!-- before --><root><!--inside--></root>"));
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::Comment);
    REQUIRE(parser.current().text == " before ");
    REQUIRE(parser.next());
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::Comment);
    REQUIRE(parser.current().text == "inside");
  }

  SECTION("Processing instruction")
  {
    Parser parser(std::string("<root><?target data here?></root>"));
    REQUIRE(parser.next());
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::ProcessingInstruction);
    REQUIRE(parser.current().name == "target");
    REQUIRE(parser.current().text == " data here");
  }

  SECTION("XML declaration exposes pseudo-attributes")
  {
    Parser parser(std::string("<?xml version=\"1.0\" encoding=\"UTF-8\"?><r/>"));
    REQUIRE(parser.next());
    const auto &decl = parser.current();
    REQUIRE(decl.kind == TokenKind::XmlDecl);
    REQUIRE(decl.attributes.size() == 2);
    REQUIRE(decl.attributeValues("encoding").front() == "UTF-8");
  }

  SECTION("Doctype with internal subset")
  {
    Parser parser(std::string("<!DOCTYPE r [<!ELEMENT r ANY>]><r/>"));
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::Doctype);
    REQUIRE(parser.current().raw == "<!DOCTYPE r [<!ELEMENT r ANY>]>");
    REQUIRE(parser.next());
    REQUIRE(parser.current().kind == TokenKind::EmptyElement);
  }
}

TEST_CASE("XML Parser - Entity Decoding", "[xml][parser][entities]")
{
  std::string out;

  SECTION("Predefined entities")
  {
    REQUIRE(Parser::decodeEntities("&lt;&gt;&amp;&apos;&quot;", out));
    REQUIRE(out == "<>&'\"");
  }

  SECTION("Numeric character references")
  {
    REQUIRE(Parser::decodeEntities("&#65;&#x42;&#X43;&#10;&#x20AC;", out));
    REQUIRE(out == "ABC\n\xE2\x82\xAC");
  }

  SECTION("Mixed content with entities")
  {
    REQUIRE(Parser::decodeEntities("Hello &amp; welcome to &lt;XML&gt;!", out));
    REQUIRE(out == "Hello & welcome to <XML>!");
  }

  SECTION("Invalid entity")
  {
    Error err;
    REQUIRE_FALSE(Parser::decodeEntities("a &bogus; b", out, &err));
    REQUIRE(err.message == "unknown entity");
    REQUIRE(err.offset == 2);
  }

  SECTION("Unterminated entity")
  {
    Error err;
    REQUIRE_FALSE(Parser::decodeEntities("a &amp b", out, &err));
    REQUIRE(err.message == "unterminated entity");
  }

  SECTION("Invalid character references")
  {
    REQUIRE_FALSE(Parser::decodeEntities("&#;", out));
    REQUIRE_FALSE(Parser::decodeEntities("&#x;", out));
    REQUIRE_FALSE(Parser::decodeEntities("&#xD800;", out));
    REQUIRE_FALSE(Parser::decodeEntities("&#x110000;", out));
    REQUIRE_FALSE(Parser::decodeEntities("&#12a;", out));
  }
}

TEST_CASE("XML Parser - QName Splitting", "[xml][parser][qname]")
{
  Parser parser(std::string("<bookmark:application/>"));
  REQUIRE(parser.next());
  auto [prefix, local] = parser.current().splitQName();
  REQUIRE(prefix == "bookmark");
  REQUIRE(local == "application");

  Parser plain(std::string("<bookmark/>"));
  REQUIRE(plain.next());
  auto [noPrefix, name] = plain.current().splitQName();
  REQUIRE(noPrefix.empty());
  REQUIRE(name == "bookmark");
}

TEST_CASE("XML Parser - Error Handling", "[xml][parser][errors]")
{
  SECTION("Missing closing tag")
  {
    REQUIRE(errorMessage("<root><child></root>").find("mismatched end tag") == 0);
    REQUIRE(errorMessage("<root><child>").find("unclosed elements") == 0);
  }

  SECTION("End tag without start")
  {
    REQUIRE(errorMessage("</root>") == "end tag without matching start tag");
  }

  SECTION("Document structure")
  {
    REQUIRE(errorMessage("") == "no root element");
    REQUIRE(errorMessage("  \n") == "no root element");
    REQUIRE(errorMessage("<a/><b/>") == "multiple root elements");
    REQUIRE(errorMessage("junk<a/>") == "character data outside of root element");
    REQUIRE(errorMessage("<a/>junk") == "character data outside of root element");
    REQUIRE(errorMessage("<![CDATA[x]]><a/>") == "CDATA outside of root element");
    REQUIRE(errorMessage("<a/>\xEF\xBB\xBF") == "character data outside of root element");
    REQUIRE(errorMessage(" \xEF\xBB\xBF<a/>") == "character data outside of root element");
    REQUIRE(errorMessage("<!-- c --><?xml version=\"1.0\"?><a/>") ==
            "XML declaration not at start of document");
  }

  SECTION("Invalid tag and attribute syntax")
  {
    REQUIRE(errorMessage("<1root/>") == "invalid start tag name");
    REQUIRE(errorMessage("<a b/>") == "expected '=' after attribute name");
    REQUIRE(errorMessage("<a b=c/>") == "expected '\"' or '\'' for attribute value");
    REQUIRE(errorMessage("<a b=\"c/>") == "unterminated attribute value");
    REQUIRE(errorMessage("<a><!-- x </a>") == "unterminated comment");
    REQUIRE(errorMessage("<a><!ELEMENT a></a>") == "unsupported markup declaration");
  }

  SECTION("Error position")
  {
    Parser parser(std::string("<a>\n  <b></c></a>"));
    while (parser.next())
    {
    }
    REQUIRE(parser.error() != nullptr);
    REQUIRE(parser.error()->line == 2);
    REQUIRE(parser.error()->column == 10);
    REQUIRE(parser.current().kind == TokenKind::Invalid);
    REQUIRE_FALSE(parser.next());
  }

  SECTION("Limits")
  {
    Options opt;
    opt.maxDepth = 2;
    Parser deep(std::string("<a><b><c/></b></a>"), opt);
    while (deep.next())
    {
    }
    REQUIRE(deep.error() != nullptr);
    REQUIRE(deep.error()->message == "maximum element depth exceeded");

    Options small;
    small.maxAttrsPerElement = 1;
    Parser attrs(std::string("<a x=\"1\" y=\"2\"/>"), small);
    REQUIRE_FALSE(attrs.next());
    REQUIRE(attrs.error()->message == "too many attributes");
  }
}

TEST_CASE("XML Parser - Streaming Input", "[xml][parser][stream]")
{
  std::string xml = "<?xml version=\"1.0\"?>\n<xbel>\n"
                    "  <bookmark href=\"file:///a\"><!-- one --><info><![CDATA[x]]></info>"
                    "</bookmark>\n"
                    "  <bookmark href=\"trash:///b\"/>\n"
                    "</xbel>\n";

  SECTION("Every chunk size yields the same tokens")
  {
    std::vector<std::string> reference;
    {
      Parser parser(xml);
      while (parser.next())
      {
        reference.emplace_back(parser.current().raw);
      }
      REQUIRE(parser.error() == nullptr);
    }

    for (std::size_t chunk : {1u, 2u, 5u, 16u, 100000u})
    {
      INFO("chunk size " << chunk);
      std::istringstream in(xml);
      Options opt;
      opt.readChunkSize = chunk;
      Parser parser(in, opt);

      std::vector<std::string> tokens;
      while (parser.next())
      {
        tokens.emplace_back(parser.current().raw);
        REQUIRE(parser.current().offset + parser.current().raw.size() == parser.position());
      }
      REQUIRE(parser.error() == nullptr);
      REQUIRE(tokens == reference);
    }
  }

  SECTION("Truncated stream")
  {
    std::istringstream in(xml.substr(0, xml.size() - 4));
    Options opt;
    opt.readChunkSize = 3;
    Parser parser(in, opt);
    while (parser.next())
    {
    }
    REQUIRE(parser.error() != nullptr);
  }
}
