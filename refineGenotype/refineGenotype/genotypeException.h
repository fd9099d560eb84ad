/*
 * File: genotypeException.h
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#pragma once

#include <stdexcept>
#include <string>

// Malformed or inconsistent genotyping summary table.
class GenotypeTableException : public std::logic_error
{
public:
    GenotypeTableException(const std::string& s) : std::logic_error(s) {}
};

// Unreadable or inconsistent molecule info archive, or missing target gene.
class MoleculeInfoException : public std::runtime_error
{
public:
    MoleculeInfoException(const std::string& s) : std::runtime_error(s) {}
};

// UMI sequence with a base outside {A,C,G,T}.
class EncodingError : public std::logic_error
{
public:
    EncodingError(const std::string& s) : std::logic_error(s) {}
};

// UMI code that does not fit the declared length.
class DecodingError : public std::logic_error
{
public:
    DecodingError(const std::string& s) : std::logic_error(s) {}
};
