// file      : sqlgen/type-map.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TYPE_MAP_HXX
#define SQLGEN_TYPE_MAP_HXX

#include <string>
#include <vector>
#include <cstddef> // std::size_t
#include <iosfwd>

#include <cutl/re.hxx>

#include <sqlgen/sql-type.hxx>
#include <sqlgen/option-types.hxx>
#include <sqlgen/diagnostics.hxx>

typedef cutl::re::regex regex;
typedef cutl::re::format regex_format;

typedef std::vector<type_map_rule> type_map_rules;

// Result of mapping a column type. Not finding a matching rule is a
// valid result: the type is then the unknown type and rule is NULL.
//
struct type_resolution
{
  type_resolution (): rule (0), index (0), specificity (0) {}

  bool
  unknown () const
  {
    return rule == 0;
  }

  std::string type;
  type_map_rule const* rule;
  std::size_t index;         // Rule position in the original list.
  unsigned short specificity;
};

// Precedence-ordered column type mapping. Among the rules whose every
// pattern matches a column the one with the most patterns wins and
// ties go to the rule that was specified first.
//
class type_map
{
public:
  // Compile the rules. A rule with an invalid regular expression is
  // reported once and excluded from the map.
  //
  type_map (type_map_rules const&,
            std::string const& unknown_type,
            diagnostics&);

  type_resolution
  resolve (std::string const& schema,
           std::string const& table,
           std::string const& column,
           sql_type const&) const;

  std::string const&
  unknown_type () const
  {
    return unknown_;
  }

  // Number of compiled (valid) rules.
  //
  std::size_t
  size () const
  {
    return rules_.size ();
  }

  // Print the compiled rules in the evaluation order, one per line,
  // together with their specificity.
  //
  void
  print (std::ostream&) const;

private:
  struct pattern
  {
    pattern (): declared (false), params (false) {}

    bool declared;
    std::string text;    // Upper-case text for literal patterns.
    bool params;         // Literal type pattern has a parameter list.
    regex re;            // Compiled expression for regex rules.
  };

  struct rule
  {
    type_map_rule r;
    std::size_t index;
    bool regex;

    pattern schema;
    pattern table;
    pattern column;
    pattern type;
  };

  typedef std::vector<rule> rules;

  bool
  match_name (rule const&, pattern const&, std::string const&) const;

  bool
  match_type (rule const&, sql_type const&) const;

private:
  rules rules_;
  std::string unknown_;
};

#endif // SQLGEN_TYPE_MAP_HXX
