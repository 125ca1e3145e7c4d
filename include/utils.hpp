#pragma once
#include <string>
#include <vector>

/**
 * @brief Text helpers shared by the tokenizers, the dataset reader and the
 * command line tools. All strings are UTF-8.
 */
class Utils {
  public:
    /**
     * @brief Removes leading and trailing whitespace in place.
     */
    static void trim(std::string& s);

    /**
     * @brief ASCII lowercase; multi-byte UTF-8 sequences are left untouched.
     */
    static std::string to_lower(const std::string& s);

    /**
     * @brief Splits a UTF-8 string into its code points, one string each.
     *
     * Malformed bytes are kept as single-byte characters.
     */
    static std::vector<std::string> utf8_characters(const std::string& s);

    /**
     * @brief Number of code points in a UTF-8 string.
     */
    static size_t utf8_length(const std::string& s);

    static bool is_ascii_punctuation(const std::string& character);

    /**
     * @brief Splits raw text into token forms.
     *
     * Whitespace separates tokens; ASCII punctuation characters become
     * tokens of their own.
     */
    static std::vector<std::string> split_text(const std::string& text);
};
