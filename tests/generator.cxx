// file      : tests/generator.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>  // std::unique_ptr
#include <string>
#include <vector>
#include <sstream>

#include <catch2/catch.hpp>

#include <sqlgen/context.hxx>
#include <sqlgen/generator.hxx>

#include "common.hxx"

using namespace std;

namespace
{
  target::entity
  make_values (string const& name, size_t n)
  {
    target::entity e;
    e.kind = target::entity::values;
    e.schema = "dbo";
    e.name = name;
    e.qualified = "dbo." + name;
    e.class_name = name;
    e.schema_ns = "dbo";
    e.loc = location ("test.sql", 1, 1);

    e.set.value_column = "Code";
    e.set.display_column = "Code";

    for (size_t i (0); i != n; ++i)
    {
      ostringstream os;
      os << "V" << i;

      target::entry en;
      en.value = os.str ();
      en.display = os.str ();
      en.name = os.str ();
      e.set.values.push_back (en);
    }

    return e;
  }

  target::entity
  make_row (string const& name)
  {
    target::entity e;
    e.kind = target::entity::table;
    e.schema = "dbo";
    e.name = name;
    e.qualified = "dbo." + name;
    e.class_name = context::escape (name);
    e.schema_ns = "dbo";
    e.loc = location ("test.sql", 1, 1);

    target::property p;
    p.column = "Id";
    p.name = "Id";
    p.type = "int";
    p.source_type = "INT";
    e.props.push_back (p);

    return e;
  }
}

TEST_CASE ("value set artifacts", "[generator]")
{
  options o (parse_options ());
  generator g (o);

  generator::entity_artifacts a (g.generate (make_values ("Color", 3)));

  REQUIRE (a.size () == 3);
  CHECK (a[0].first == "dbo.Color.hxx");
  CHECK (a[1].first == "dbo.Color-data.cxx");
  CHECK (a[2].first == "dbo.Color-serialization.cxx");

  string const& h (a[0].second);
  CHECK (contains (h, "#ifndef DBO_COLOR_HXX"));
  CHECK (contains (h, "namespace dbo"));
  CHECK (contains (h, "class Color"));
  CHECK (contains (h, "static const Color V2;"));
  CHECK (contains (h, "count = 3UL;"));

  string const& dt (a[1].second);
  CHECK (contains (dt, "#include \"dbo.Color.hxx\""));
  CHECK (contains (dt, "const Color Color::V1 (1U);"));
  CHECK (contains (dt, "\"V2\""));

  string const& s (a[2].second);
  CHECK (contains (s, "invalid dbo.Color value '"));
  CHECK (contains (s, "operator>>"));
}

TEST_CASE ("match helper size limit", "[generator]")
{
  options o (parse_options ());
  generator g (o);

  SECTION ("10 values")
  {
    generator::entity_artifacts a (g.generate (make_values ("Small", 10)));
    REQUIRE (a.size () == 3);

    string const& h (a[0].second);
    CHECK (contains (h, "match ("));
    CHECK (contains (h, "#include <stdexcept>"));
    CHECK (occurrences (h, "case ") == 10);
    CHECK (contains (h, "return h9 ();"));
  }

  SECTION ("25 values")
  {
    generator::entity_artifacts a (g.generate (make_values ("Edge", 25)));
    CHECK (occurrences (a[0].second, "case ") == 25);
  }

  SECTION ("30 values")
  {
    generator::entity_artifacts a (g.generate (make_values ("Large", 30)));
    REQUIRE (a.size () == 3);

    string const& h (a[0].second);
    CHECK (!contains (h, "match"));
    CHECK (!contains (h, "case "));
    CHECK (!contains (h, "<stdexcept>"));
    CHECK (contains (h, "count = 30UL;"));
  }
}

TEST_CASE ("row entity artifact", "[generator]")
{
  vector<string> args;
  args.push_back ("--type-map");
  args.push_back ("INT=int");
  args.push_back ("--type-map");
  args.push_back ("NVARCHAR=std::string");
  args.push_back ("--namespace");
  args.push_back ("shop::model");
  args.push_back ("--hxx-prologue");
  args.push_back ("#include <optional>");
  options o (parse_options (args));

  diagnostics d;
  unique_ptr<target::model> m (
    transform_sql ("CREATE TABLE Users (\n"
                   "  Id INT NOT NULL PRIMARY KEY,\n"
                   "  Name NVARCHAR(50) NULL,\n"
                   "  Photo VARBINARY(MAX) NOT NULL);\n",
                   o, d));
  REQUIRE (m.get () != 0);

  generator g (o);
  generator::entity_artifacts a (g.generate (m->ents[0]));

  REQUIRE (a.size () == 1);
  CHECK (a[0].first == "dbo.Users.hxx");

  string const& h (a[0].second);
  CHECK (contains (h, "#include <optional>"));
  CHECK (contains (h, "namespace shop"));
  CHECK (contains (h, "namespace model"));
  CHECK (contains (h, "// Table dbo.Users."));
  CHECK (contains (h, "class Users"));
  CHECK (contains (h, "int const&"));
  CHECK (contains (h, "std::optional< std::string > Name_;"));
  CHECK (contains (h, "// Unmapped source type VARBINARY(MAX)."));
  CHECK (contains (h, "unknown_type Photo_;"));
  CHECK (contains (h, "operator== (Users const& x, Users const& y)"));
  CHECK (contains (h, "x.Photo () == y.Photo ()"));
}

TEST_CASE ("row entity column comments", "[generator]")
{
  options o (parse_options ());

  diagnostics d;
  unique_ptr<target::model> m (
    transform_sql ("CREATE TABLE Users (Id INT NOT NULL PRIMARY KEY);\n"
                   "CREATE TABLE Orders (\n"
                   "  Id INT NOT NULL PRIMARY KEY,\n"
                   "  UserId INT NOT NULL REFERENCES Users (Id)\n"
                   "    ON DELETE CASCADE,\n"
                   "  Status CHAR(1) NOT NULL DEFAULT ('N'));\n",
                   o, d));
  REQUIRE (m.get () != 0);

  generator g (o);
  generator::entity_artifacts a (g.generate (m->ents[1]));

  REQUIRE (a.size () == 1);

  string const& h (a[0].second);
  CHECK (contains (h, "// UserId INT NOT NULL, references dbo.Users.Id "
                      "ON DELETE CASCADE"));
  CHECK (contains (h, "// Status CHAR(1) NOT NULL DEFAULT ('N')"));
}

TEST_CASE ("artifact collisions", "[generator]")
{
  options o (parse_options ());
  generator g (o);

  target::model m;
  m.ents.push_back (make_row ("a/b"));
  m.ents.push_back (make_row ("a_b"));
  m.ents.push_back (make_values ("Color", 2));
  m.ents[1].loc = location ("test.sql", 2, 1);

  diagnostics d;
  artifacts r (g.generate (m, d));

  REQUIRE (d.size () == 2);
  CHECK (d[0].kind == diagnostic::output_collision);
  CHECK (d[0].fatal ());
  CHECK (d[0].loc.line == 2);
  CHECK (d[0].message ==
         "artifact 'dbo.a_b.hxx' of table 'dbo.a_b' collides with an "
         "artifact of table 'dbo.a/b'");
  CHECK (d[1].severity == diagnostic::info);
  CHECK (d[1].loc.line == 1);

  // The other artifacts are still produced.
  //
  CHECK (r.size () == 4);
  CHECK (r.find ("dbo.a_b.hxx") != r.end ());
  CHECK (r.find ("dbo.Color-data.cxx") != r.end ());
}

TEST_CASE ("generation is deterministic", "[generator]")
{
  vector<string> args;
  args.push_back ("--jobs");
  args.push_back ("4");
  options o4 (parse_options (args));
  options o1 (parse_options ());

  target::model m;

  for (size_t i (0); i != 12; ++i)
  {
    ostringstream os;
    os << "Set" << i;
    m.ents.push_back (make_values (os.str (), i + 1));
  }

  generator g1 (o1), g4 (o4);

  diagnostics d1, d4;
  artifacts r1 (g1.generate (m, d1));
  artifacts r4 (g4.generate (m, d4));

  CHECK (d1.empty ());
  CHECK (d4.empty ());
  CHECK (r1.size () == 36);
  CHECK (r1 == r4);
}
