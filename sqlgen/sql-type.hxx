// file      : sqlgen/sql-type.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SQL_TYPE_HXX
#define SQLGEN_SQL_TYPE_HXX

#include <string>

struct invalid_sql_type
{
  invalid_sql_type (std::string const& message): message_ (message) {}

  std::string const&
  message () const
  {
    return message_;
  }

private:
  std::string message_;
};

// Parsed SQL Server column type.
//
struct sql_type
{
  // Keep the order in each block of types.
  //
  enum core_type
  {
    // Integral types.
    //
    BIT,
    TINYINT,
    SMALLINT,
    INT,
    BIGINT,

    // Fixed and floating point types.
    //
    DECIMAL,
    SMALLMONEY,
    MONEY,
    FLOAT,

    // String and binary types.
    //
    CHAR,
    VARCHAR,
    TEXT,

    NCHAR,
    NVARCHAR,
    NTEXT,

    BINARY,
    VARBINARY,
    IMAGE,

    // Date-time types.
    //
    DATE,
    TIME,
    DATETIME,
    DATETIME2,
    SMALLDATETIME,
    DATETIMEOFFSET,

    // Other types.
    //
    UNIQUEIDENTIFIER,
    ROWVERSION,
    SQL_VARIANT,
    XML,
    GEOGRAPHY,
    GEOMETRY,
    HIERARCHYID,

    // User-defined or otherwise unrecognized type. The name is
    // preserved as declared.
    //
    other,

    // Invalid type.
    //
    invalid
  };

  sql_type () :
      type (invalid), has_prec (false), prec (0), has_scale (false), scale (0)
  {
  }

  core_type type;

  bool has_prec;
  unsigned short prec;  // Max numeric value is 8000. 0 indicates
                        // 'max' as in VARCHAR(max).
  bool has_scale;
  unsigned short scale; // Max value is 38.

  std::string other_name; // Name of the other type.
  std::string params;     // Normalized explicit parameters, e.g. "10,2".

  // Base type name in upper case (e.g., NVARCHAR). For other types
  // this is the declared name.
  //
  std::string
  name () const;

  // Normalized declaration, e.g., NVARCHAR(50) or DECIMAL(10,2). Only
  // explicitly specified parameters are included.
  //
  std::string
  string () const;

  // Parse a type declaration. Throw invalid_sql_type if it is
  // malformed. Unrecognized type names are not errors and result in
  // the other core type.
  //
  static sql_type
  parse (std::string const&);
};

#endif // SQLGEN_SQL_TYPE_HXX
