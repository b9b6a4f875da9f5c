// file      : tests/type-map.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <string>
#include <sstream>

#include <catch2/catch.hpp>

#include <sqlgen/type-map.hxx>

#include "common.hxx"

using namespace std;

namespace
{
  type_map_rules&
  operator<< (type_map_rules& rs, char const* s)
  {
    type_map_rule r;
    istringstream is (s);
    is >> r;
    REQUIRE (!is.fail ());
    rs.push_back (r);
    return rs;
  }

  string
  resolve (type_map const& m,
           string const& column,
           string const& type,
           string const& table = "Users",
           string const& schema = "dbo")
  {
    return m.resolve (schema, table, column, sql_type::parse (type)).type;
  }
}

TEST_CASE ("more specific rule wins", "[type-map]")
{
  type_map_rules rs;
  rs << "NVARCHAR=text"
     << "column=Email;type=NVARCHAR;as=email-string";

  diagnostics d;
  type_map m (rs, "unknown_type", d);
  REQUIRE (d.empty ());
  REQUIRE (m.size () == 2);

  type_resolution r (
    m.resolve ("dbo", "Users", "Email", sql_type::parse ("NVARCHAR(100)")));
  CHECK (r.type == "email-string");
  CHECK (r.specificity == 2);
  CHECK (r.index == 1);
  CHECK (!r.unknown ());

  r = m.resolve ("dbo", "Users", "Username", sql_type::parse ("NVARCHAR(50)"));
  CHECK (r.type == "text");
  CHECK (r.specificity == 1);
  CHECK (r.index == 0);

  // Names are matched case-insensitively.
  //
  CHECK (resolve (m, "EMAIL", "nvarchar(10)") == "email-string");
}

TEST_CASE ("first specified rule wins a tie", "[type-map]")
{
  type_map_rules rs;
  rs << "table=Users;type=INT;as=first"
     << "column=Id;type=INT;as=second"
     << "schema=dbo;table=Users;column=Id;type=BIGINT;as=big";

  diagnostics d;
  type_map m (rs, "unknown_type", d);

  CHECK (resolve (m, "Id", "INT") == "first");
  CHECK (resolve (m, "Id", "INT", "Orders") == "second");
  CHECK (resolve (m, "Id", "BIGINT") == "big");
  CHECK (resolve (m, "Id", "BIGINT", "Users", "sales") == "unknown_type");
}

TEST_CASE ("literal type patterns", "[type-map]")
{
  type_map_rules rs;
  rs << "nvarchar (50)=short_string"
     << "NVARCHAR=text"
     << "INTEGER=int"
     << "dbo.PhoneNumber=phone";

  diagnostics d;
  type_map m (rs, "unknown_type", d);
  REQUIRE (d.empty ());

  CHECK (resolve (m, "A", "NVARCHAR(50)") == "short_string");
  CHECK (resolve (m, "A", "NVARCHAR(51)") == "text");
  CHECK (resolve (m, "A", "NVARCHAR(MAX)") == "text");
  CHECK (resolve (m, "A", "int") == "int");
  CHECK (resolve (m, "A", "DBO.PHONENUMBER") == "phone");
  CHECK (resolve (m, "A", "VARCHAR(50)") == "unknown_type");
}

TEST_CASE ("regular expression patterns", "[type-map]")
{
  type_map_rules rs;
  rs << "regex:type=N?(VAR)?CHAR;as=std::string"
     << "regex:column=.*id;type=INT|BIGINT;as=id_type"
     << "regex:type=DECIMAL\\(\\d+,2\\);as=money";

  diagnostics d;
  type_map m (rs, "unknown_type", d);
  REQUIRE (d.empty ());

  CHECK (resolve (m, "Name", "NVARCHAR(10)") == "std::string");
  CHECK (resolve (m, "Name", "char") == "std::string");
  CHECK (resolve (m, "Name", "TEXT") == "unknown_type");
  CHECK (resolve (m, "UserId", "BIGINT") == "id_type");
  CHECK (resolve (m, "Count", "BIGINT") == "unknown_type");
  CHECK (resolve (m, "Price", "DECIMAL(10,2)") == "money");
  CHECK (resolve (m, "Price", "DECIMAL(10,3)") == "unknown_type");
}

TEST_CASE ("invalid regular expression", "[type-map]")
{
  type_map_rules rs;
  rs << "regex:type=(INT;as=broken"
     << "INT=int";

  diagnostics d;
  type_map m (rs, "unknown_type", d);

  REQUIRE (d.size () == 1);
  CHECK (d[0].kind == diagnostic::type_rule_error);
  CHECK (d[0].fatal ());
  CHECK (contains (d[0].message, "regex:type=(INT;as=broken"));
  CHECK (m.size () == 1);

  type_resolution r (m.resolve ("dbo", "T", "C", sql_type::parse ("INT")));
  CHECK (r.type == "int");
  CHECK (r.index == 1);
}

TEST_CASE ("unknown fallback", "[type-map]")
{
  type_map_rules rs;
  rs << "regex:type=.*;as=anything";

  diagnostics d;
  type_map m (rs, "opaque", d);
  CHECK (m.unknown_type () == "opaque");

  // A view column without a declared type is never mapped.
  //
  type_resolution r (m.resolve ("dbo", "V", "C", sql_type ()));
  CHECK (r.unknown ());
  CHECK (r.type == "opaque");
  CHECK (r.rule == 0);

  type_map e (type_map_rules (), "opaque", d);
  r = e.resolve ("dbo", "T", "C", sql_type::parse ("INT"));
  CHECK (r.unknown ());
  CHECK (r.type == "opaque");
}

TEST_CASE ("rule listing", "[type-map]")
{
  type_map_rules rs;
  rs << "INT=int"
     << "table=T;column=C;type=BIT;as=bool";

  diagnostics d;
  type_map m (rs, "unknown_type", d);

  ostringstream os;
  m.print (os);

  CHECK (os.str () ==
         "1: [1] type=INT;as=int\n"
         "2: [3] table=T;column=C;type=BIT;as=bool\n");
}
