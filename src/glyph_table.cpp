/**
 * @file glyph_table.cpp
 * @brief Byte to display glyph mapping for trace dump rows
 * @version 0.1
 * @date 2025-10-14
 */

#include "../include/io/trace_logger.hpp"

#include <array>

namespace serialio {

    namespace {

        // Code page 437, 0x80..0xFF, as UTF-8. Every entry is one column wide.
        constexpr std::array<const char*, 128> CP437_HIGH = {
            // 0x80
            "Ç", "ü", "é", "â", "ä", "à", "å", "ç",
            "ê", "ë", "è", "ï", "î", "ì", "Ä", "Å",
            // 0x90
            "É", "æ", "Æ", "ô", "ö", "ò", "û", "ù",
            "ÿ", "Ö", "Ü", "¢", "£", "¥", "₧", "ƒ",
            // 0xA0
            "á", "í", "ó", "ú", "ñ", "Ñ", "ª", "º",
            "¿", "⌐", "¬", "½", "¼", "¡", "«", "»",
            // 0xB0
            "░", "▒", "▓", "│", "┤", "╡", "╢", "╖",
            "╕", "╣", "║", "╗", "╝", "╜", "╛", "┐",
            // 0xC0
            "└", "┴", "┬", "├", "─", "┼", "╞", "╟",
            "╚", "╔", "╩", "╦", "╠", "═", "╬", "╧",
            // 0xD0
            "╨", "╤", "╥", "╙", "╘", "╒", "╓", "╫",
            "╪", "┘", "┌", "█", "▄", "▌", "▐", "▀",
            // 0xE0
            "α", "ß", "Γ", "π", "Σ", "σ", "µ", "τ",
            "Φ", "Θ", "Ω", "δ", "∞", "φ", "ε", "∩",
            // 0xF0
            "≡", "±", "≥", "≤", "⌠", "⌡", "÷", "≈",
            "°", "∙", "·", "√", "ⁿ", "²", "■", "\u00A0",
        };

        using AsciiGlyph = std::array<char, 2>;

        // Controls render as '.', everything else in 0x20..0x7F as itself
        std::array<AsciiGlyph, 128> build_ascii_table() {
            std::array<AsciiGlyph, 128> table{};
            for (std::size_t i = 0; i < table.size(); ++i) {
                table[i] = AsciiGlyph{i < 0x20 ? '.' : static_cast<char>(i), '\0'};
            }
            return table;
        }

    } // namespace

    const char* display_glyph(std::uint8_t byte) {
        static const std::array<AsciiGlyph, 128> ascii = build_ascii_table();
        if (byte < 0x80) {
            return ascii[byte].data();
        }
        return CP437_HIGH[byte - 0x80];
    }

} // namespace serialio
