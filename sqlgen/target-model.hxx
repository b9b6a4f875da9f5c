// file      : sqlgen/target-model.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TARGET_MODEL_HXX
#define SQLGEN_TARGET_MODEL_HXX

#include <string>
#include <vector>
#include <cstddef> // std::size_t

#include <sqlgen/literal.hxx>
#include <sqlgen/diagnostics.hxx>

// C++ code model produced from the relational model. It is immutable
// once built and is shared by the generation threads.
//
namespace target
{
  struct property
  {
    property ()
        : ordinal (0),
          null (false),
          primary (false),
          identity (false),
          unknown (false),
          foreign (false)
    {
    }

    std::string column;      // Source column name.
    std::string name;        // Escaped C++ name.
    std::size_t ordinal;

    std::string type;        // Mapped C++ type.
    std::string source_type; // Normalized source type declaration.
    std::string default_;    // DEFAULT expression as written.

    bool null;
    bool primary;
    bool identity;
    bool unknown;            // No rule matched the source type.

    // Foreign key annotation.
    //
    bool foreign;
    std::string foreign_table;
    std::string foreign_column;
    std::string foreign_actions; // Non-default referential actions.
  };

  typedef std::vector<property> properties;

  // Value set extra attribute. The entry values for an attribute are
  // stored in the entries in the attribute order.
  //
  typedef property attribute;
  typedef std::vector<attribute> attributes;

  struct entry
  {
    std::string value;
    std::string display;
    std::string name;        // Escaped C++ name of the constant.
    std::vector<literal> attributes;
  };

  typedef std::vector<entry> entries;

  struct value_set
  {
    std::string value_column;
    std::string display_column;

    attributes attrs;
    entries values;
  };

  struct entity
  {
    enum kind_type
    {
      table,
      view,
      values
    };

    entity (): kind (table) {}

    kind_type kind;

    std::string schema;      // Source schema name.
    std::string name;        // Source table or view name.
    std::string qualified;   // Qualified name, e.g., dbo.Users.
    std::string class_name;  // Escaped C++ class name.
    std::string schema_ns;   // Escaped C++ schema namespace name.
    location loc;

    properties props;        // Row entities only.
    value_set set;           // Value sets only.
  };

  typedef std::vector<entity> entities;

  struct model
  {
    entities ents;
  };
}

#endif // SQLGEN_TARGET_MODEL_HXX
