/** \file   Main.h
 *  \brief  Default main entry point.
 *
 *  \copyright 2020-2024 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


/** \brief Programs linking against the library implement this instead of main().
 *  \note  The library's main() sets ::progname, strips an optional leading "--min-log-level=(ERROR|WARNING|INFO|DEBUG)"
 *         argument and reports exceptions that escape Main() via LOG_ERROR.
 */
int Main(int argc, char *argv[]);
