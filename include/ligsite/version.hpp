// Copyright The ligsite Authors.

#ifndef LIGSITE_VERSION_HPP_
#define LIGSITE_VERSION_HPP_

#define LIGSITE_VERSION "0.1.0"

#endif
