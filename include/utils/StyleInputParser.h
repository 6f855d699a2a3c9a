#ifndef STYLEINPUTPARSER_H
#define STYLEINPUTPARSER_H

#include <QString>
#include <optional>

/**
 * StyleInputParser - Validation for free-text style input
 *
 * Turns the raw text of a width entry into a stroke width. Non-numeric,
 * non-finite or non-positive input is rejected so the caller keeps its
 * previous value.
 */
class StyleInputParser {
public:
    StyleInputParser() = delete;

    static std::optional<qreal> parseWidth(const QString& text);
};

#endif // STYLEINPUTPARSER_H
