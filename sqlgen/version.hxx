// file      : sqlgen/version.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_VERSION_HXX
#define SQLGEN_VERSION_HXX

// Version format is AABBCCDD where
//
// AA - major version number
// BB - minor version number
// CC - bugfix version number
// DD - alpha / beta (DD + 50) version number
//
// When DD is not 00, 1 is subtracted from AABBCC. For example:
//
// Version     AABBCCDD
// 1.0.0       01000000
// 1.1.0       01010000
// 1.1.1       01010100
// 1.2.0.a1    01019901
// 2.0.0.b2    01999952
//
#define SQLGEN_VERSION     1000000
#define SQLGEN_VERSION_STR "1.0.0"

#endif // SQLGEN_VERSION_HXX
