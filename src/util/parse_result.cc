#include "parse_result.hpp"

std::string
patchwork::repr(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::None:
            return "None";
        case ParseErrorKind::File:
            return "File";
        case ParseErrorKind::Header:
            return "Header";
        case ParseErrorKind::Range:
            return "Range";
        case ParseErrorKind::LinePrefix:
            return "LinePrefix";
        case ParseErrorKind::CountMismatch:
            return "CountMismatch";
        case ParseErrorKind::Tokenization:
            return "Tokenization";
        case ParseErrorKind::Parsing:
            return "Parsing";
    }
    return "Unknown";
}
