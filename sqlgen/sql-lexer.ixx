// file      : sqlgen/sql-lexer.ixx
// license   : GNU GPL v3; see accompanying LICENSE file

// sql_lexer::xchar
//
inline sql_lexer::xchar::
xchar (int_type v, std::size_t l, std::size_t c, std::size_t o)
    : v_ (v), l_ (l), c_ (c), o_ (o)
{
}

inline sql_lexer::xchar::
operator char_type () const
{
  return traits_type::to_char_type (v_);
}

inline sql_lexer::xchar::int_type sql_lexer::xchar::
value () const
{
  return v_;
}

inline std::size_t sql_lexer::xchar::
line () const
{
  return l_;
}

inline std::size_t sql_lexer::xchar::
column () const
{
  return c_;
}

inline std::size_t sql_lexer::xchar::
offset () const
{
  return o_;
}

// sql_lexer
//
inline bool sql_lexer::
is_eos (xchar const& c) const
{
  return c.value () == xchar::traits_type::eof ();
}
