#ifndef __BOARD_FILE_OPERATIONS_HPP___
#define __BOARD_FILE_OPERATIONS_HPP___

#include <istream>
#include <ostream>
#include <string>

#include "board.hpp"

/**
 * @file board_file_operations.hpp
 * @brief Simple helpers to read/write `Board` values from plain text files.
 *
 * The file format is a minimal whitespace-separated text format:
 * first line contains `width height goal_x goal_y piece_count`, followed by
 * one line per piece, in board order: `x y size H|V marked`, where `marked`
 * is 0 or 1.
 */

/**
 * @brief Parse a `Board` from a text stream.
 *
 * @param in Input stream positioned at the header line.
 * @throws std::invalid_argument on missing numbers, an unknown axis letter,
 *         non-positive dimensions or a non-positive piece size.
 * @return Constructed `Board` instance.
 */
Board read_board(std::istream& in);

/**
 * @brief Serialize a `Board` to a text stream in the format read by `read_board`.
 */
void write_board(const Board& board, std::ostream& out);

/**
 * @brief Read a `Board` from a plain-text file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws std::invalid_argument if the content is malformed.
 * @return Constructed `Board` instance.
 */
Board read_board_from_file(const std::string& filename);

/**
 * @brief Write a `Board` to a plain-text file.
 *
 * @param board Board to serialize.
 * @param filename Output file path.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_board_to_file(const Board& board, const std::string& filename);

#endif // __BOARD_FILE_OPERATIONS_HPP___
