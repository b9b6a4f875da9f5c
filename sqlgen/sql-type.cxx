// file      : sqlgen/sql-type.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cctype>  // std::toupper
#include <sstream>

#include <sqlgen/sql-type.hxx>
#include <sqlgen/sql-lexer.hxx>

using namespace std;

static const char* type_names[] =
{
  "BIT",
  "TINYINT",
  "SMALLINT",
  "INT",
  "BIGINT",

  "DECIMAL",
  "SMALLMONEY",
  "MONEY",
  "FLOAT",

  "CHAR",
  "VARCHAR",
  "TEXT",

  "NCHAR",
  "NVARCHAR",
  "NTEXT",

  "BINARY",
  "VARBINARY",
  "IMAGE",

  "DATE",
  "TIME",
  "DATETIME",
  "DATETIME2",
  "SMALLDATETIME",
  "DATETIMEOFFSET",

  "UNIQUEIDENTIFIER",
  "ROWVERSION",
  "SQL_VARIANT",
  "XML",
  "GEOGRAPHY",
  "GEOMETRY",
  "HIERARCHYID"
};

static string
upcase (string const& s)
{
  string r (s);

  for (string::size_type i (0); i != r.size (); ++i)
    r[i] = static_cast<char> (toupper (static_cast<unsigned char> (r[i])));

  return r;
}

string sql_type::
name () const
{
  switch (type)
  {
  case other:
    return other_name;
  case invalid:
    return std::string ();
  default:
    return type_names[type];
  }
}

string sql_type::
string () const
{
  std::string r (name ());

  if (!params.empty ())
  {
    r += '(';
    r += params;
    r += ')';
  }

  return r;
}

namespace
{
  struct sql_parser
  {
    sql_parser (std::string const& sql)
        : l_ (sql)
    {
    }

    sql_type
    parse ()
    {
      r_ = sql_type ();

      try
      {
        parse_name ();

        sql_token t (l_.next ());

        if (t.type () != sql_token::t_eos)
        {
          throw invalid_sql_type ("unexpected '" + t.string () + "' in "
                                  "SQL Server type declaration");
        }
      }
      catch (sql_lexer::invalid_input const& e)
      {
        throw invalid_sql_type ("invalid SQL Server type declaration: " +
                                e.message);
      }

      return r_;
    }

    void
    parse_name ()
    {
      sql_token t (l_.next ());

      if (t.type () != sql_token::t_identifier)
      {
        throw invalid_sql_type ("expected SQL Server type name "
                                "instead of '" + t.string () + "'");
      }

      string id (t.quoted () ? string () : upcase (t.identifier ()));

      // A schema-qualified name is always a user-defined type.
      //
      if (l_.peek ().punctuation () == sql_token::p_dot)
        id.clear ();

      if (id == "BIT")
      {
        r_.type = sql_type::BIT;
      }
      else if (id == "TINYINT")
      {
        r_.type = sql_type::TINYINT;
      }
      else if (id == "SMALLINT")
      {
        r_.type = sql_type::SMALLINT;
      }
      else if (id == "INT" ||
               id == "INTEGER")
      {
        r_.type = sql_type::INT;
      }
      else if (id == "BIGINT")
      {
        r_.type = sql_type::BIGINT;
      }
      else if (id == "DECIMAL" ||
               id == "NUMERIC" ||
               id == "DEC")
      {
        r_.type = sql_type::DECIMAL;

        r_.has_prec = true;
        r_.prec = 18;

        r_.has_scale = true;
        r_.scale = 0;

        parse_precision ();
      }
      else if (id == "SMALLMONEY")
      {
        r_.type = sql_type::SMALLMONEY;
      }
      else if (id == "MONEY")
      {
        r_.type = sql_type::MONEY;
      }
      else if (id == "REAL")
      {
        r_.type = sql_type::FLOAT;

        r_.has_prec = true;
        r_.prec = 24;
      }
      else if (id == "FLOAT")
      {
        r_.type = sql_type::FLOAT;

        r_.has_prec = true;
        r_.prec = 53;

        parse_precision ();
      }
      else if (id == "DOUBLE")
      {
        t = l_.next ();

        if (t.type () != sql_token::t_identifier ||
            upcase (t.identifier ()) != "PRECISION")
        {
          throw invalid_sql_type ("expected 'PRECISION' instead of '"
                                  + t.string () + "'");
        }

        r_.type = sql_type::FLOAT;

        r_.has_prec = true;
        r_.prec = 53;

        parse_precision ();
      }
      else if (id == "CHAR" ||
               id == "CHARACTER")
      {
        parse_char_trailer (false);
      }
      else if (id == "VARCHAR")
      {
        r_.type = sql_type::VARCHAR;

        r_.has_prec = true;
        r_.prec = 1;

        parse_precision ();
      }
      else if (id == "TEXT")
      {
        r_.type = sql_type::TEXT;
      }
      else if (id == "NCHAR")
      {
        r_.type = sql_type::NCHAR;

        r_.has_prec = true;
        r_.prec = 1;

        parse_precision ();
      }
      else if (id == "NVARCHAR")
      {
        r_.type = sql_type::NVARCHAR;

        r_.has_prec = true;
        r_.prec = 1;

        parse_precision ();
      }
      else if (id == "NTEXT")
      {
        r_.type = sql_type::NTEXT;
      }
      else if (id == "NATIONAL")
      {
        t = l_.next ();

        if (t.type () == sql_token::t_identifier)
          id = upcase (t.identifier ());

        if (id == "TEXT")
        {
          r_.type = sql_type::NTEXT;
        }
        else if (id == "CHAR" ||
                 id == "CHARACTER")
        {
          parse_char_trailer (true);
        }
        else
        {
          throw invalid_sql_type (
            "expected 'CHAR', 'CHARACTER', or 'TEXT' instead of '"
            + t.string () + "'");
        }
      }
      else if (id == "BINARY")
      {
        // Can be just BINARY or BINARY VARYING.
        //
        t = l_.peek ();

        if (t.type () == sql_token::t_identifier &&
            upcase (t.identifier ()) == "VARYING")
        {
          l_.next ();
          r_.type = sql_type::VARBINARY;
        }
        else
          r_.type = sql_type::BINARY;

        r_.has_prec = true;
        r_.prec = 1;

        parse_precision ();
      }
      else if (id == "VARBINARY")
      {
        r_.type = sql_type::VARBINARY;

        r_.has_prec = true;
        r_.prec = 1;

        parse_precision ();
      }
      else if (id == "IMAGE")
      {
        r_.type = sql_type::IMAGE;
      }
      else if (id == "DATE")
      {
        r_.type = sql_type::DATE;
      }
      else if (id == "TIME")
      {
        r_.type = sql_type::TIME;

        r_.has_scale = true;
        r_.scale = 7;

        parse_precision ();
      }
      else if (id == "DATETIME")
      {
        r_.type = sql_type::DATETIME;
      }
      else if (id == "DATETIME2")
      {
        r_.type = sql_type::DATETIME2;

        r_.has_scale = true;
        r_.scale = 7;

        parse_precision ();
      }
      else if (id == "SMALLDATETIME")
      {
        r_.type = sql_type::SMALLDATETIME;
      }
      else if (id == "DATETIMEOFFSET")
      {
        r_.type = sql_type::DATETIMEOFFSET;

        r_.has_scale = true;
        r_.scale = 7;

        parse_precision ();
      }
      else if (id == "UNIQUEIDENTIFIER")
      {
        r_.type = sql_type::UNIQUEIDENTIFIER;
      }
      else if (id == "ROWVERSION" ||
               id == "TIMESTAMP")
      {
        r_.type = sql_type::ROWVERSION;
      }
      else if (id == "SQL_VARIANT")
      {
        r_.type = sql_type::SQL_VARIANT;
      }
      else if (id == "XML")
      {
        r_.type = sql_type::XML;

        // XML can be followed by the schema collection, as in
        // XML(CONTENT dbo.schema). Treat it as an opaque parameter.
        //
        parse_opaque ();
      }
      else if (id == "GEOGRAPHY")
      {
        r_.type = sql_type::GEOGRAPHY;
      }
      else if (id == "GEOMETRY")
      {
        r_.type = sql_type::GEOMETRY;
      }
      else if (id == "HIERARCHYID")
      {
        r_.type = sql_type::HIERARCHYID;
      }
      else
      {
        // User-defined type, possibly schema-qualified.
        //
        r_.type = sql_type::other;
        r_.other_name = t.identifier ();

        while (l_.peek ().punctuation () == sql_token::p_dot)
        {
          l_.next ();
          t = l_.next ();

          if (t.type () != sql_token::t_identifier)
          {
            throw invalid_sql_type ("expected type name after '.' instead "
                                    "of '" + t.string () + "'");
          }

          r_.other_name += '.';
          r_.other_name += t.identifier ();
        }

        parse_opaque ();
      }
    }

    void
    parse_precision ()
    {
      if (l_.peek ().punctuation () != sql_token::p_lparen)
        return;

      l_.next ();

      // Parse the precision.
      //
      sql_token t (l_.next ());

      if (t.type () == sql_token::t_identifier &&
          upcase (t.identifier ()) == "MAX")
      {
        switch (r_.type)
        {
        case sql_type::VARCHAR:
        case sql_type::NVARCHAR:
        case sql_type::VARBINARY:
          break;
        default:
          throw invalid_sql_type (
            "'MAX' is only valid for VARCHAR, NVARCHAR, and VARBINARY");
        }

        r_.prec = 0;
        r_.has_prec = true;
        r_.params = "MAX";
      }
      else if (t.type () == sql_token::t_int_lit)
      {
        unsigned short v;
        istringstream is (t.literal ());

        if (!(is >> v && is.eof ()))
        {
          throw invalid_sql_type (
            "invalid precision value '" + t.literal () + "' in SQL "
            "Server type declaration");
        }

        switch (r_.type)
        {
        case sql_type::TIME:
        case sql_type::DATETIME2:
        case sql_type::DATETIMEOFFSET:
          {
            r_.scale = v;
            r_.has_scale = true;
            break;
          }
        default:
          {
            r_.prec = v;
            r_.has_prec = true;
            break;
          }
        }

        r_.params = t.literal ();
      }
      else
      {
        throw invalid_sql_type (
          "integer precision expected in SQL Server type declaration");
      }

      // Parse the scale if present.
      //
      t = l_.next ();

      if (t.punctuation () == sql_token::p_comma)
      {
        // Scale can only be specified for the DECIMAL type.
        //
        if (r_.type != sql_type::DECIMAL)
        {
          throw invalid_sql_type (
            "unexpected scale in SQL Server type declaration");
        }

        t = l_.next ();

        if (t.type () != sql_token::t_int_lit)
        {
          throw invalid_sql_type (
            "integer scale expected in SQL Server type declaration");
        }

        istringstream is (t.literal ());

        if (!(is >> r_.scale && is.eof ()))
        {
          throw invalid_sql_type (
            "invalid scale value '" + t.literal () + "' in SQL Server "
            "type declaration");
        }

        r_.has_scale = true;
        r_.params += ',';
        r_.params += t.literal ();
        t = l_.next ();
      }

      if (t.punctuation () != sql_token::p_rparen)
      {
        throw invalid_sql_type (
          "expected ')' in SQL Server type declaration");
      }
    }

    // Parenthesized parameters whose content we do not interpret.
    //
    void
    parse_opaque ()
    {
      if (l_.peek ().punctuation () != sql_token::p_lparen)
        return;

      l_.next ();

      for (size_t depth (1);;)
      {
        sql_token t (l_.next ());

        switch (t.punctuation ())
        {
        case sql_token::p_lparen:
          depth++;
          break;
        case sql_token::p_rparen:
          depth--;
          break;
        default:
          break;
        }

        if (depth == 0)
          break;

        if (t.type () == sql_token::t_eos)
        {
          throw invalid_sql_type (
            "expected ')' in SQL Server type declaration");
        }

        if (!r_.params.empty ())
        {
          char p (r_.params[r_.params.size () - 1]);

          if (p != ',' && p != '.' &&
              t.punctuation () != sql_token::p_comma &&
              t.punctuation () != sql_token::p_dot)
            r_.params += ' ';
        }

        r_.params += t.string ();
      }
    }

    void
    parse_char_trailer (bool nat)
    {
      sql_token t (l_.peek ());

      if (t.type () == sql_token::t_identifier &&
          upcase (t.identifier ()) == "VARYING")
      {
        l_.next ();
        r_.type = nat ? sql_type::NVARCHAR : sql_type::VARCHAR;
      }
      else
        r_.type = nat ? sql_type::NCHAR : sql_type::CHAR;

      r_.has_prec = true;
      r_.prec = 1;

      parse_precision ();
    }

  private:
    sql_lexer l_;
    sql_type r_;
  };
}

sql_type sql_type::
parse (std::string const& t)
{
  sql_parser p (t);
  return p.parse ();
}
