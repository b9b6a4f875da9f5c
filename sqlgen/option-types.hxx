// file      : sqlgen/option-types.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_OPTION_TYPES_HXX
#define SQLGEN_OPTION_TYPES_HXX

#include <iosfwd>
#include <string>

// Type mapping rule as specified with the --type-map option. An empty
// schema, table, or column pattern means "any". The type pattern and
// the target type are always present in a successfully parsed rule.
//
struct type_map_rule
{
  type_map_rule (): regex (false) {}

  std::string schema;
  std::string table;
  std::string column;
  std::string type;
  std::string as;

  // True if the patterns are regular expressions rather than names.
  //
  bool regex;

  // Number of patterns declared by this rule. The type pattern always
  // counts so the result is in the [1, 4] range.
  //
  unsigned short
  patterns () const
  {
    return 1 +
      (schema.empty () ? 0 : 1) +
      (table.empty () ? 0 : 1) +
      (column.empty () ? 0 : 1);
  }

  // Canonical (long form) representation suitable for diagnostics.
  //
  std::string
  string () const;
};

std::istream&
operator>> (std::istream&, type_map_rule&);

std::ostream&
operator<< (std::ostream&, type_map_rule const&);

// Value set specification as specified with the --value-set option.
// Empty column names mean "use the default".
//
struct value_set_spec
{
  std::string table;
  std::string value;
  std::string display;
};

std::istream&
operator>> (std::istream&, value_set_spec&);

std::ostream&
operator<< (std::ostream&, value_set_spec const&);

#endif // SQLGEN_OPTION_TYPES_HXX
