// file      : tests/sql-type.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <catch2/catch.hpp>

#include <sqlgen/sql-type.hxx>

TEST_CASE ("core types", "[sql-type]")
{
  sql_type t (sql_type::parse ("int"));
  CHECK (t.type == sql_type::INT);
  CHECK (t.name () == "INT");
  CHECK (t.string () == "INT");

  CHECK (sql_type::parse ("INTEGER").type == sql_type::INT);
  CHECK (sql_type::parse ("numeric(5)").type == sql_type::DECIMAL);
  CHECK (sql_type::parse ("REAL").type == sql_type::FLOAT);
  CHECK (sql_type::parse ("double precision").type == sql_type::FLOAT);
  CHECK (sql_type::parse ("char varying(10)").type == sql_type::VARCHAR);
  CHECK (sql_type::parse ("timestamp").type == sql_type::ROWVERSION);
}

TEST_CASE ("parameters", "[sql-type]")
{
  sql_type t (sql_type::parse ("nvarchar ( max )"));
  CHECK (t.type == sql_type::NVARCHAR);
  CHECK (t.has_prec);
  CHECK (t.prec == 0);
  CHECK (t.string () == "NVARCHAR(MAX)");

  t = sql_type::parse ("DECIMAL(10, 2)");
  CHECK (t.type == sql_type::DECIMAL);
  CHECK (t.prec == 10);
  CHECK (t.scale == 2);
  CHECK (t.params == "10,2");
  CHECK (t.string () == "DECIMAL(10,2)");

  // Defaults are not part of the normalized declaration.
  //
  t = sql_type::parse ("decimal");
  CHECK (t.prec == 18);
  CHECK (t.params.empty ());
  CHECK (t.string () == "DECIMAL");

  t = sql_type::parse ("datetime2(3)");
  CHECK (t.type == sql_type::DATETIME2);
  CHECK (t.has_scale);
  CHECK (t.scale == 3);
  CHECK (t.string () == "DATETIME2(3)");
}

TEST_CASE ("user-defined types", "[sql-type]")
{
  sql_type t (sql_type::parse ("dbo.PhoneNumber"));
  CHECK (t.type == sql_type::other);
  CHECK (t.name () == "dbo.PhoneNumber");

  t = sql_type::parse ("GEOMETRYX");
  CHECK (t.type == sql_type::other);
  CHECK (t.name () == "GEOMETRYX");

  // A quoted name is never a built-in type.
  //
  t = sql_type::parse ("[int]");
  CHECK (t.type == sql_type::other);
  CHECK (t.name () == "int");
}

TEST_CASE ("malformed declarations", "[sql-type]")
{
  CHECK_THROWS_AS (sql_type::parse ("INT(10"), invalid_sql_type);
  CHECK_THROWS_AS (sql_type::parse ("VARCHAR(abc)"), invalid_sql_type);
  CHECK_THROWS_AS (sql_type::parse ("INT(MAX)"), invalid_sql_type);
  CHECK_THROWS_AS (sql_type::parse ("VARCHAR(10,2)"), invalid_sql_type);
  CHECK_THROWS_AS (sql_type::parse ("42"), invalid_sql_type);
  CHECK_THROWS_AS (sql_type::parse ("INT INT"), invalid_sql_type);
}

TEST_CASE ("invalid type", "[sql-type]")
{
  sql_type t;
  CHECK (t.type == sql_type::invalid);
  CHECK (t.name ().empty ());
  CHECK (t.string ().empty ());
}
