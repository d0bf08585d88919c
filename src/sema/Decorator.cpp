/***
 * Name: pytdc::sema::RecognizeDecorator
 * Purpose: Classify a decorator spelling.
 */
#include "sema/Decorator.h"
#include <string>

namespace pytdc::sema {

Decorator RecognizeDecorator(const std::string& text) {
  using Tag = Decorator::Tag;
  Decorator deco;
  deco.text = text;
  if (text == "property") { deco.tag = Tag::Property; return deco; }
  if (text == "classmethod") { deco.tag = Tag::ClassMethod; return deco; }
  if (text == "staticmethod") { deco.tag = Tag::StaticMethod; return deco; }
  if (text == "overload" || text == "typing.overload") { deco.tag = Tag::Overload; return deco; }
  if (text == "abstractmethod" || text == "abc.abstractmethod") { deco.tag = Tag::AbstractMethod; return deco; }
  const auto dot = text.rfind('.');
  if (dot != std::string::npos) {
    const std::string suffix = text.substr(dot + 1);
    if (suffix == "setter" || suffix == "deleter") {
      deco.tag = suffix == "setter" ? Tag::Setter : Tag::Deleter;
      deco.target = text.substr(0, dot);
      return deco;
    }
  }
  deco.tag = Tag::Unrecognized;
  return deco;
}

} // namespace pytdc::sema
