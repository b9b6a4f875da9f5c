// file      : tests/refiner.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory> // std::unique_ptr
#include <string>
#include <vector>
#include <sstream>

#include <catch2/catch.hpp>

#include <sqlgen/refiner.hxx>
#include <sqlgen/ingestor.hxx>

#include "common.hxx"

using namespace std;

namespace relational = semantics::relational;

namespace
{
  unique_ptr<relational::model>
  refine (sources const& ss,
          diagnostics& d,
          vector<string> const& args = vector<string> ())
  {
    options o (parse_options (args));

    ingestor i (o);
    raw::models ms (i.ingest (ss, d));
    REQUIRE (!d.fatal ());

    refiner r (o);
    return r.refine (ms, d);
  }

  unique_ptr<relational::model>
  refine (string const& text, diagnostics& d)
  {
    sources ss;
    ss.push_back (source ("test.sql", text));
    return refine (ss, d);
  }

  size_t
  indexes (relational::table const& t)
  {
    size_t n (0);

    for (relational::scope::names_const_iterator i (t.names_begin ());
         i != t.names_end ();
         ++i)
    {
      if (i->nameable ().is_a<relational::index> ())
        n++;
    }

    return n;
  }
}

TEST_CASE ("merge across sources", "[refiner]")
{
  sources ss;
  ss.push_back (
    source ("users.sql",
            "CREATE TABLE Users (\n"
            "  Id INT NOT NULL PRIMARY KEY,\n"
            "  Name NVARCHAR(50));\n"));
  ss.push_back (
    source ("orders.sql",
            "CREATE TABLE sales.Orders (\n"
            "  Id INT NOT NULL,\n"
            "  UserId INT NOT NULL,\n"
            "  CONSTRAINT PK_Orders PRIMARY KEY (Id));\n"
            "ALTER TABLE sales.Orders ADD FOREIGN KEY (UserId)\n"
            "  REFERENCES dbo.Users ON DELETE CASCADE;\n"));

  diagnostics d;
  unique_ptr<relational::model> m (refine (ss, d));

  REQUIRE (m.get () != 0);
  CHECK (d.empty ());
  CHECK (m->names_size () == 2);

  relational::table* u (m->find<relational::table> ("dbo.users"));
  REQUIRE (u != 0);
  CHECK (u->qualified_name ().string () == "dbo.Users");
  REQUIRE (u->primary () != 0);
  CHECK (u->find<relational::column> ("Id")->primary ());
  CHECK (!u->find<relational::column> ("Name")->primary ());

  relational::table* o (m->find<relational::table> ("sales.Orders"));
  REQUIRE (o != 0);

  relational::foreign_key* fk (o->find<relational::foreign_key> ("fk:1"));
  REQUIRE (fk != 0);
  CHECK (fk->resolved ());
  CHECK (&fk->referenced ().table () == u);
  CHECK (fk->on_delete () == relational::foreign_key::cascade);
  REQUIRE (fk->referenced_columns ().size () == 1);
  CHECK (fk->referenced_columns ()[0] == "Id");
  REQUIRE (fk->contains_size () == 1);
  CHECK (fk->contains_at (0).column ().name () == "UserId");

  CHECK (u->referenced_begin () != u->referenced_end ());
}

TEST_CASE ("references among many tables", "[refiner]")
{
  // Each table references the previous one and the first one references
  // the last, declared after it. Referenced names differ in case.
  //
  size_t const n (300);
  ostringstream os;

  for (size_t i (0); i != n; ++i)
  {
    size_t p (i == 0 ? n - 1 : i - 1);

    os << "CREATE TABLE T" << i << " (\n"
       << "  Id INT NOT NULL PRIMARY KEY,\n"
       << "  ParentId INT CONSTRAINT FK_" << i
       << " REFERENCES dbo.t" << p << " (id));\n"
       << "INSERT INTO t" << i << " VALUES (" << i << ", " << p << ");\n";
  }

  diagnostics d;
  unique_ptr<relational::model> m (refine (os.str (), d));

  REQUIRE (m.get () != 0);
  CHECK (d.empty ());
  CHECK (m->names_size () == n);

  for (size_t i (0); i != n; ++i)
  {
    ostringstream tn, fn, pn;
    tn << "dbo.T" << i;
    fn << "FK_" << i;
    pn << "dbo.T" << (i == 0 ? n - 1 : i - 1);

    relational::table* t (m->find<relational::table> (tn.str ()));
    REQUIRE (t != 0);

    relational::foreign_key* fk (
      t->find<relational::foreign_key> (fn.str ()));
    REQUIRE (fk != 0);
    REQUIRE (fk->resolved ());
    CHECK (fk->referenced ().table ().qualified_name ().string () ==
           pn.str ());
  }
}

TEST_CASE ("duplicate definitions", "[refiner]")
{
  sources ss;
  ss.push_back (source ("a.sql", "CREATE TABLE Users (Id INT);"));
  ss.push_back (
    source ("b.sql",
            "CREATE TABLE dbo.USERS (Id INT);\n"
            "CREATE TABLE Orders (Id INT, Id BIGINT,\n"
            "  UserId INT REFERENCES Nowhere (Id));"));

  diagnostics d;
  unique_ptr<relational::model> m (refine (ss, d));

  CHECK (m.get () == 0);
  REQUIRE (d.size () == 3);

  CHECK (d[0].kind == diagnostic::duplicate_definition);
  CHECK (d[0].severity == diagnostic::error);
  CHECK (d[0].loc.file == "b.sql");
  CHECK (contains (d[0].message, "table 'dbo.Users' is already defined"));

  CHECK (d[1].severity == diagnostic::info);
  CHECK (d[1].loc.file == "a.sql");

  CHECK (d[2].kind == diagnostic::duplicate_definition);
  CHECK (contains (d[2].message, "column 'Id'"));

  // Foreign keys are not resolved once merging failed.
  //
  CHECK (find_diagnostic (d, diagnostic::reference_error) == 0);
}

TEST_CASE ("unresolved references", "[refiner]")
{
  diagnostics d;
  unique_ptr<relational::model> m (
    refine ("CREATE TABLE Orders (\n"
            "  Id INT,\n"
            "  UserId INT REFERENCES Nowhere (Id),\n"
            "  ItemId INT REFERENCES Items (Missing));\n"
            "CREATE TABLE Items (Id INT PRIMARY KEY);\n"
            "CREATE VIEW V AS SELECT 1 AS X;\n"
            "CREATE INDEX IX_V ON V (X);\n"
            "INSERT INTO Ghost VALUES (1);\n",
            d));

  CHECK (m.get () == 0);
  REQUIRE (d.size () == 4);

  for (diagnostics::iterator i (d.begin ()); i != d.end (); ++i)
  {
    CHECK (i->kind == diagnostic::reference_error);
    CHECK (i->fatal ());
  }

  CHECK (contains (d[0].message, "refers to view 'dbo.V'"));
  CHECK (contains (d[1].message, "references unknown table 'dbo.Nowhere'"));
  CHECK (d[1].loc.line == 3);
  CHECK (contains (d[2].message, "references unknown column 'Missing'"));
  CHECK (contains (d[3].message, "INSERT into unknown table 'dbo.Ghost'"));
}

TEST_CASE ("foreign key to a table without primary key", "[refiner]")
{
  diagnostics d;
  unique_ptr<relational::model> m (
    refine ("CREATE TABLE A (Id INT);\n"
            "CREATE TABLE B (AId INT REFERENCES A);\n",
            d));

  CHECK (m.get () == 0);
  REQUIRE (d.size () == 1);
  CHECK (d[0].kind == diagnostic::reference_error);
  CHECK (contains (d[0].message, "has no primary key"));
}

TEST_CASE ("identical indexes are merged", "[refiner]")
{
  diagnostics d;
  unique_ptr<relational::model> m (
    refine ("CREATE TABLE T (Id INT, Name NVARCHAR(10), Code INT);\n"
            "CREATE INDEX IX_Name ON T (Name);\n"
            "CREATE INDEX IX_Name_Again ON dbo.T (name);\n"
            "CREATE UNIQUE INDEX UX_Name ON T (Name);\n"
            "CREATE INDEX IX_Name_Code ON T (Name, Code);\n",
            d));

  REQUIRE (m.get () != 0);
  CHECK (d.empty ());

  relational::table& t (*m->find<relational::table> ("dbo.T"));
  CHECK (indexes (t) == 3);

  relational::index* x (t.find<relational::index> ("IX_Name"));
  REQUIRE (x != 0);
  CHECK (!x->unique ());
  CHECK (t.find<relational::index> ("IX_Name_Again") == 0);

  relational::index* u (t.find<relational::index> ("UX_Name"));
  REQUIRE (u != 0);
  CHECK (u->unique ());

  relational::index* c (t.find<relational::index> ("IX_Name_Code"));
  REQUIRE (c != 0);
  CHECK (c->contains_size () == 2);
}

TEST_CASE ("index on unknown column", "[refiner]")
{
  diagnostics d;
  unique_ptr<relational::model> m (
    refine ("CREATE TABLE T (Id INT, INDEX IX_X (Missing));\n", d));

  CHECK (m.get () == 0);
  REQUIRE (d.size () == 1);
  CHECK (d[0].kind == diagnostic::reference_error);
  CHECK (contains (d[0].message, "unknown column 'Missing'"));
}

TEST_CASE ("primary key normalization", "[refiner]")
{
  SECTION ("table-level key")
  {
    diagnostics d;
    unique_ptr<relational::model> m (
      refine ("CREATE TABLE T (A INT, B INT,\n"
              "  CONSTRAINT PK_T PRIMARY KEY NONCLUSTERED (B, A));\n",
              d));

    REQUIRE (m.get () != 0);

    relational::table& t (*m->find<relational::table> ("dbo.T"));
    relational::primary_key* pk (t.primary ());
    REQUIRE (pk != 0);
    CHECK (pk->name () == "PK_T");
    CHECK (!pk->clustered ());
    REQUIRE (pk->contains_size () == 2);
    CHECK (pk->contains_at (0).column ().name () == "B");
    CHECK (t.find<relational::column> ("A")->primary ());
  }

  SECTION ("multiple column-level keys")
  {
    diagnostics d;
    unique_ptr<relational::model> m (
      refine ("CREATE TABLE T (A INT PRIMARY KEY, B INT PRIMARY KEY);\n", d));

    CHECK (m.get () == 0);
    REQUIRE (d.size () == 1);
    CHECK (d[0].kind == diagnostic::constraint_error);
    CHECK (contains (d[0].message, "multiple primary keys"));
  }

  SECTION ("multiple key constraints")
  {
    diagnostics d;
    unique_ptr<relational::model> m (
      refine ("CREATE TABLE T (A INT, B INT, PRIMARY KEY (A));\n"
              "ALTER TABLE T ADD CONSTRAINT PK2 PRIMARY KEY (B);\n",
              d));

    CHECK (m.get () == 0);
    REQUIRE (d.size () == 2);
    CHECK (d[0].kind == diagnostic::constraint_error);
    CHECK (d[0].loc.line == 2);
    CHECK (d[1].severity == diagnostic::info);
    CHECK (d[1].loc.line == 1);
  }

  SECTION ("conflicting declarations")
  {
    diagnostics d;
    unique_ptr<relational::model> m (
      refine ("CREATE TABLE T (A INT PRIMARY KEY, B INT,\n"
              "  PRIMARY KEY (B));\n",
              d));

    CHECK (m.get () == 0);
    REQUIRE (d.size () == 1);
    CHECK (d[0].kind == diagnostic::constraint_error);
    CHECK (contains (d[0].message, "does not match column 'A'"));
  }
}

TEST_CASE ("seed rows", "[refiner]")
{
  diagnostics d;
  unique_ptr<relational::model> m (
    refine ("CREATE TABLE S (Code CHAR(1), Label NVARCHAR(20), Rank INT);\n"
            "INSERT INTO S (Label, Code) VALUES ('Active', 'A');\n"
            "INSERT INTO S VALUES ('I', 'Inactive', 2), ('X', 'Bad');\n",
            d));

  CHECK (m.get () == 0);
  REQUIRE (d.size () == 1);
  CHECK (d[0].kind == diagnostic::constraint_error);
  CHECK (contains (d[0].message, "row has 2 value(s)"));
  CHECK (d[0].loc.line == 3);
}

TEST_CASE ("seed rows are mapped to columns", "[refiner]")
{
  diagnostics d;
  unique_ptr<relational::model> m (
    refine ("CREATE TABLE S (Code CHAR(1), Label NVARCHAR(20), Rank INT);\n"
            "INSERT INTO S (Label, Code) VALUES ('Active', 'A');\n"
            "INSERT INTO S VALUES ('I', 'Inactive', 2);\n",
            d));

  REQUIRE (m.get () != 0);

  relational::table& t (*m->find<relational::table> ("dbo.S"));
  REQUIRE (t.rows ().size () == 2);

  relational::table::row const& r0 (t.rows ()[0]);
  REQUIRE (r0.size () == 3);
  CHECK (r0[0].value == "A");
  CHECK (r0[1].value == "Active");
  CHECK (r0[2].null ());

  CHECK (t.rows ()[1][2].value == "2");
}

TEST_CASE ("default schema", "[refiner]")
{
  vector<string> args;
  args.push_back ("--default-schema");
  args.push_back ("app");

  sources ss;
  ss.push_back (source ("test.sql",
                        "CREATE TABLE T (Id INT PRIMARY KEY);\n"
                        "CREATE TABLE U (TId INT REFERENCES app.T);\n"));

  diagnostics d;
  unique_ptr<relational::model> m (refine (ss, d, args));

  REQUIRE (m.get () != 0);
  CHECK (m->find<relational::table> ("app.T") != 0);
  CHECK (m->find<relational::table> ("dbo.T") == 0);
}
