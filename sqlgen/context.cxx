// file      : sqlgen/context.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <set>
#include <cctype>  // std::toupper
#include <cassert>

#include <sqlgen/context.hxx>

using namespace std;

namespace
{
  char const* keywords[] =
  {
    "NULL",
    "alignas",
    "alignof",
    "and",
    "and_eq",
    "asm",
    "auto",
    "bitand",
    "bitor",
    "bool",
    "break",
    "case",
    "catch",
    "char",
    "char16_t",
    "char32_t",
    "class",
    "compl",
    "const",
    "const_cast",
    "constexpr",
    "continue",
    "decltype",
    "default",
    "delete",
    "do",
    "double",
    "dynamic_cast",
    "else",
    "enum",
    "explicit",
    "export",
    "extern",
    "false",
    "float",
    "for",
    "friend",
    "goto",
    "if",
    "inline",
    "int",
    "long",
    "mutable",
    "namespace",
    "new",
    "noexcept",
    "not",
    "not_eq",
    "nullptr",
    "operator",
    "or",
    "or_eq",
    "private",
    "protected",
    "public",
    "register",
    "reinterpret_cast",
    "return",
    "short",
    "signed",
    "sizeof",
    "static",
    "static_assert",
    "static_cast",
    "struct",
    "switch",
    "template",
    "this",
    "thread_local",
    "throw",
    "true",
    "try",
    "typedef",
    "typeid",
    "typename",
    "union",
    "unsigned",
    "using",
    "virtual",
    "void",
    "volatile",
    "wchar_t",
    "while",
    "xor",
    "xor_eq"
  };

  typedef std::set<string> keyword_set_type;

  keyword_set_type const&
  keyword_set ()
  {
    static keyword_set_type const s (
      keywords, keywords + sizeof (keywords) / sizeof (char const*));
    return s;
  }

  string
  charlit (unsigned int u)
  {
    string r ("\\x");
    bool lead (true);

    for (short i (sizeof (unsigned int) * 2 - 1); i >= 0 ; --i)
    {
      unsigned int x ((u >> (i * 4)) & 0x0F);

      if (lead)
      {
        if (x == 0)
          continue;

        lead = false;
      }

      r += static_cast<char> (x < 10 ? ('0' + x) : ('A' + x - 10));
    }

    if (lead)
      r += '0';

    return r;
  }

  // Source expression as a C++ comment.
  //
  string
  comment (string const& s)
  {
    string r (" /* ");

    for (string::size_type i (0); i < s.size (); ++i)
    {
      r += s[i];

      if (s[i] == '*' && i + 1 < s.size () && s[i + 1] == '/')
        r += ' ';
    }

    return r + " */";
  }
}

thread_local context* context::current_;

context::
~context ()
{
  if (current_ == this)
    current_ = 0;
}

context::
context (ostream& os_, options_type const& ops)
    : os (os_), options (ops)
{
  assert (current_ == 0);
  current_ = this;
}

context::
context ()
    : os (current ().os), options (current ().options)
{
}

string context::
upcase (string const& s)
{
  string r;
  string::size_type n (s.size ());

  r.reserve (n);

  for (string::size_type i (0); i < n; ++i)
    r += static_cast<char> (toupper (static_cast<unsigned char> (s[i])));

  return r;
}

string context::
escape (string const& name)
{
  typedef string::size_type size;

  string r;
  size n (name.size ());

  // In most common cases we will have that many characters.
  //
  r.reserve (n);

  for (size i (0); i < n; ++i)
  {
    char c (name[i]);

    if (i == 0)
    {
      if (!((c >= 'a' && c <= 'z') ||
            (c >= 'A' && c <= 'Z') ||
            c == '_'))
        r = (c >= '0' && c <= '9') ? "cxx_" : "cxx";
    }

    if (!((c >= 'a' && c <= 'z') ||
          (c >= 'A' && c <= 'Z') ||
          (c >= '0' && c <= '9') ||
          c == '_'))
      r += '_';
    else
      r += c;
  }

  if (r.empty ())
    r = "cxx";

  // Keywords.
  //
  if (keyword_set ().find (r) != keyword_set ().end ())
    r += '_';

  return r;
}

string context::
strlit (string const& str)
{
  string r;
  string::size_type n (str.size ());

  // In most common cases we will have that many chars.
  //
  r.reserve (n + 2);

  r += '"';

  bool escape (false);

  for (string::size_type i (0); i < n; ++i)
  {
    unsigned int u (static_cast<unsigned char> (str[i]));

    // [128 - ]     - as \xXX (UTF-8 sequences are preserved)
    // 127          - \x7F
    // [32  - 126]  - as is
    // [0   - 31]   - \X or \xXX
    //
    if (u < 32 || u >= 127)
    {
      switch (u)
      {
      case '\n':
        {
          r += "\\n";
          break;
        }
      case '\t':
        {
          r += "\\t";
          break;
        }
      case '\r':
        {
          r += "\\r";
          break;
        }
      default:
        {
          r += charlit (u);
          escape = true;
          break;
        }
      }
    }
    else
    {
      if (escape)
      {
        // Close and open the string so there are no clashes.
        //
        r += '"';
        r += '"';

        escape = false;
      }

      switch (u)
      {
      case '"':
        {
          r += "\\\"";
          break;
        }
      case '\\':
        {
          r += "\\\\";
          break;
        }
      default:
        {
          r += static_cast<char> (u);
          break;
        }
      }
    }
  }

  r += '"';

  return r;
}

string context::
guard (string const& file)
{
  string r;

  for (string::size_type i (0); i < file.size (); ++i)
  {
    char c (file[i]);

    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
        (c >= '0' && c <= '9'))
      r += static_cast<char> (toupper (c));
    else
      r += '_';
  }

  if (!r.empty () && r[0] >= '0' && r[0] <= '9')
    r.insert (0, "_");

  return r;
}

void context::
open_ns (target::entity const& e)
{
  string const& ns (options.namespace_ ());

  // The --namespace value can be nested, as in a::b.
  //
  for (string::size_type b (0), p; b < ns.size (); b = p + 2)
  {
    p = ns.find ("::", b);

    if (p == string::npos)
      p = ns.size ();

    if (p != b)
      os << "namespace " << ns.substr (b, p - b)
         << "{";
  }

  os << "namespace " << e.schema_ns
     << "{";
}

void context::
close_ns (target::entity const&)
{
  os << "}";

  string const& ns (options.namespace_ ());

  for (string::size_type b (0), p; b < ns.size (); b = p + 2)
  {
    p = ns.find ("::", b);

    if (p == string::npos)
      p = ns.size ();

    if (p != b)
      os << "}";
  }
}

string context::
member_type (target::property const& p) const
{
  if (!p.null)
    return p.type;

  return options.nullable_wrapper () + "< " + p.type + " >";
}

string context::
initializer (target::attribute const& a, literal const& l) const
{
  string t (member_type (a));

  if (a.unknown)
    return t + " ()" + comment (l.value);

  switch (l.kind)
  {
  case literal::null_lit:
    {
      return t + " ()";
    }
  case literal::string_lit:
    {
      return t + " (" + strlit (l.value) + ")";
    }
  case literal::number_lit:
    {
      return t + " (" + l.value + ")";
    }
  case literal::keyword_lit:
    {
      string k (upcase (l.value));

      if (k == "TRUE")
        return t + " (true)";
      else if (k == "FALSE")
        return t + " (false)";

      break;
    }
  }

  // Function calls and other expressions cannot be evaluated.
  //
  return t + " ()" + comment (l.value);
}

void context::
prologue ()
{
  strings const& p (options.hxx_prologue ());

  for (strings::const_iterator i (p.begin ()); i != p.end (); ++i)
    os << *i << endl;

  if (!p.empty ())
    os << endl;
}

string context::
file_name (target::entity const& e)
{
  string r (e.schema + '.' + e.name);

  for (string::size_type i (0); i < r.size (); ++i)
  {
    char c (r[i]);

    if (c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' ||
        c == '"' || c == '<' || c == '>' || c == '|' ||
        static_cast<unsigned char> (c) < 32)
      r[i] = '_';
  }

  return r;
}

string context::
hxx_name (target::entity const& e) const
{
  return file_name (e) + options.hxx_suffix ();
}

string context::
data_name (target::entity const& e) const
{
  return file_name (e) + "-data" + options.cxx_suffix ();
}

string context::
serialization_name (target::entity const& e) const
{
  return file_name (e) + "-serialization" + options.cxx_suffix ();
}
