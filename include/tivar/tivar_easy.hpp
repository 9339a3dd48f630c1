#pragma once

#include "tivar/tivar.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tivar::easy {

namespace detail {
inline Real complex_part(double v) {
    Real r = Real::from_double(v);
    r.flags = kComplexPartFlags;
    return r;
}
} // namespace detail

inline CalculatorValue make_real(double v) {
    return CalculatorValue::make_real(Real::from_double(v));
}

// Complex parts carry the 0x0C type bits the calculator writes.
inline CalculatorValue make_complex(double re, double im) {
    Complex c;
    c.re = detail::complex_part(re);
    c.im = detail::complex_part(im);
    return CalculatorValue::make_complex(c);
}

inline CalculatorValue make_real_list(const std::vector<double>& values) {
    RealList l;
    l.elements.reserve(values.size());
    for (double v : values) l.elements.push_back(Real::from_double(v));
    return CalculatorValue::make_real_list(l);
}

inline CalculatorValue make_complex_list(const std::vector<std::pair<double, double>>& values) {
    ComplexList l;
    l.elements.reserve(values.size());
    for (const auto& v : values) {
        Complex c;
        c.re = detail::complex_part(v.first);
        c.im = detail::complex_part(v.second);
        l.elements.push_back(c);
    }
    return CalculatorValue::make_complex_list(l);
}

// Row-major fill: idx = r * cols + c
inline CalculatorValue make_matrix(std::size_t rows, std::size_t cols,
                                   const std::vector<double>& data_rowmajor) {
    Matrix m;
    m.rows = rows;
    m.cols = cols;
    m.elements.reserve(data_rowmajor.size());
    for (double v : data_rowmajor) m.elements.push_back(Real::from_double(v));
    return CalculatorValue::make_matrix(m);
}

inline CalculatorValue make_string(std::vector<std::uint8_t> glyphs) {
    String s;
    s.data = std::move(glyphs);
    return CalculatorValue::make_string(s);
}

inline CalculatorValue make_program(std::vector<std::uint8_t> tokens,
                                    ProgramKind kind = ProgramKind::Program) {
    Program p;
    p.kind = kind;
    p.tokens = std::move(tokens);
    return CalculatorValue::make_program(p);
}

inline VariableEntry make_entry(const VarName& name, CalculatorValue value, bool archived = false) {
    VariableEntry e;
    e.name = name;
    e.flags = archived ? kArchivedFlag : 0;
    e.value = std::move(value);
    return e;
}

inline void add(CalculatorFile& file, const VarName& name, CalculatorValue value, bool archived = false) {
    file.entries.push_back(make_entry(name, std::move(value), archived));
}

} // namespace tivar::easy
