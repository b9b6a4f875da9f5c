// file      : sqlgen/literal.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_LITERAL_HXX
#define SQLGEN_LITERAL_HXX

#include <string>

#include <sqlgen/diagnostics.hxx>

// Value of an INSERT ... VALUES row.
//
struct literal
{
  enum kind_type
  {
    null_lit,
    string_lit,
    number_lit,
    keyword_lit // TRUE, FALSE, or another bare word.
  };

  literal (): kind (null_lit), national (false) {}

  literal (kind_type k, std::string const& v, location const& l)
      : kind (k), value (v), national (false), loc (l)
  {
  }

  bool
  null () const
  {
    return kind == null_lit;
  }

  kind_type kind;
  std::string value;
  bool national;
  location loc;
};

#endif // SQLGEN_LITERAL_HXX
